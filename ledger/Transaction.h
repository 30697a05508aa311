#pragma once

#include "../lib/ResultOrError.hpp"

#include <map>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace pos {

/**
 * Transaction - immutable transfer record
 *
 * Sender and receiver are opaque identities; no balances are tracked.
 * Metadata is kept sorted by key so its encoding never depends on the order
 * entries were added in.
 */
class Transaction {
public:
  using Metadata = std::map<std::string, std::string>;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_AMOUNT = 1; // Negative or non-finite amount
  constexpr static int32_t E_FORMAT = 2; // Malformed JSON representation

  /**
   * Create a transaction stamped with the current time
   * @return The transaction, or E_AMOUNT if amount is negative or not finite
   */
  static Roe<Transaction> create(const std::string &sender,
                                 const std::string &receiver, double amount,
                                 const Metadata &data = {});

  /**
   * Create a transaction with an explicit creation time
   */
  static Roe<Transaction> create(const std::string &sender,
                                 const std::string &receiver, double amount,
                                 const Metadata &data, double timestamp);

  static Roe<Transaction> ltsFromJson(const nlohmann::json &jd);

  const std::string &getSender() const { return sender_; }
  const std::string &getReceiver() const { return receiver_; }
  double getAmount() const { return amount_; }
  const Metadata &getData() const { return data_; }
  double getTimestamp() const { return timestamp_; }

  /**
   * Canonical record: {"amount","data","receiver","sender","timestamp"}
   */
  nlohmann::json toJson() const;

  bool operator==(const Transaction &other) const;
  bool operator!=(const Transaction &other) const { return !(*this == other); }

private:
  Transaction(const std::string &sender, const std::string &receiver,
              double amount, const Metadata &data, double timestamp);

  std::string sender_;
  std::string receiver_;
  double amount_{ 0 };
  Metadata data_;
  double timestamp_{ 0 };
};

std::ostream &operator<<(std::ostream &os, const Transaction &tx);

} // namespace pos
