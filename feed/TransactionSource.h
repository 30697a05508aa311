#pragma once

#include "../lib/ResultOrError.hpp"

#include <map>
#include <string>
#include <vector>

namespace pos {
namespace feed {

/**
 * Transaction-shaped record delivered by a source.
 * Not validated yet; the consumer turns it into a Transaction.
 */
struct TransactionRecord {
  std::string sender;
  std::string receiver;
  double amount{ 0 };
  std::map<std::string, std::string> data;
};

/**
 * Interface for anything that can supply pending transactions
 */
class TransactionSource {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_TRANSPORT = 1; // Request could not be completed
  constexpr static int32_t E_STATUS = 2;    // Non-success response status
  constexpr static int32_t E_PAYLOAD = 3;   // Response body malformed

  virtual ~TransactionSource() = default;

  /**
   * Fetch up to count records. Blocks until the source answers or its own
   * timeout expires.
   */
  virtual Roe<std::vector<TransactionRecord>> fetch(size_t count) = 0;

  virtual std::string getName() const = 0;
};

} // namespace feed
} // namespace pos
