#pragma once

#include "Transaction.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pos {

/**
 * Block - immutable, content-addressed batch of transactions
 *
 * The hash is computed once at construction from the canonical encoding of
 * (index, timestamp, transactions, previousHash, proposer) and never
 * recomputed in place. Only a block restored from JSON may carry a hash that
 * disagrees with its fields; chain validation rejects such a block.
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FORMAT = 1; // Malformed JSON representation

  constexpr static size_t HASH_SIZE = 64; // hex characters

  Block(uint64_t index, double timestamp,
        const std::vector<Transaction> &transactions,
        const std::string &previousHash, const std::string &proposer);

  /**
   * Restore a block from its JSON form, keeping the stored hash as is
   */
  static Roe<Block> ltsFromJson(const nlohmann::json &jd);

  /**
   * Hash of a block's fields
   *
   * SHA-256 over the compact JSON record
   * {"index","previous_hash","timestamp","transactions","validator"} with
   * keys sorted at every level and transactions in stored order.
   */
  static std::string calculateHash(uint64_t index, double timestamp,
                                   const std::vector<Transaction> &transactions,
                                   const std::string &previousHash,
                                   const std::string &proposer);

  /** Recompute the hash from the current fields */
  std::string calculateHash() const;

  uint64_t getIndex() const { return index_; }
  double getTimestamp() const { return timestamp_; }
  const std::vector<Transaction> &getTransactions() const { return transactions_; }
  const std::string &getPreviousHash() const { return previousHash_; }
  const std::string &getProposer() const { return proposer_; }
  const std::string &getHash() const { return hash_; }

  /** Fields plus the stored hash */
  nlohmann::json toJson() const;

private:
  static nlohmann::json canonicalRecord(uint64_t index, double timestamp,
                                        const std::vector<Transaction> &transactions,
                                        const std::string &previousHash,
                                        const std::string &proposer);

  uint64_t index_{ 0 };
  double timestamp_{ 0 };
  std::vector<Transaction> transactions_;
  std::string previousHash_;
  std::string proposer_;
  std::string hash_;
};

std::ostream &operator<<(std::ostream &os, const Block &block);

} // namespace pos
