#pragma once

#include "../ledger/Transaction.h"

#include <cstddef>
#include <deque>
#include <vector>

namespace pos {
namespace consensus {

/**
 * FIFO pool of transactions waiting for inclusion in a block
 */
class TransactionPool {
public:
  void add(const Transaction &tx);
  void add(const std::vector<Transaction> &txes);

  /** Oldest min(count, size()) transactions, pool unchanged */
  std::vector<Transaction> peek(size_t count) const;

  /**
   * Remove the oldest transactions
   * @return Number actually removed
   */
  size_t drain(size_t count);

  size_t size() const { return pending_.size(); }
  bool empty() const { return pending_.empty(); }
  std::vector<Transaction> getTransactions() const;

private:
  std::deque<Transaction> pending_;
};

} // namespace consensus
} // namespace pos
