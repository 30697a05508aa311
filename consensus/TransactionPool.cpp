#include "TransactionPool.h"

#include <algorithm>

namespace pos {
namespace consensus {

void TransactionPool::add(const Transaction &tx) { pending_.push_back(tx); }

void TransactionPool::add(const std::vector<Transaction> &txes) {
  pending_.insert(pending_.end(), txes.begin(), txes.end());
}

std::vector<Transaction> TransactionPool::peek(size_t count) const {
  size_t n = std::min(count, pending_.size());
  return std::vector<Transaction>(pending_.begin(), pending_.begin() + n);
}

size_t TransactionPool::drain(size_t count) {
  size_t n = std::min(count, pending_.size());
  pending_.erase(pending_.begin(), pending_.begin() + n);
  return n;
}

std::vector<Transaction> TransactionPool::getTransactions() const {
  return std::vector<Transaction>(pending_.begin(), pending_.end());
}

} // namespace consensus
} // namespace pos
