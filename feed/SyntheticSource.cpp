#include "SyntheticSource.h"
#include "../lib/Utilities.h"

namespace pos {
namespace feed {

SyntheticSource::SyntheticSource(std::mt19937_64 &rng)
    : rng_(rng), addresses_(rng), amountDist_(MIN_AMOUNT, MAX_AMOUNT) {}

TransactionRecord SyntheticSource::generate() {
  TransactionRecord record;
  record.sender = addresses_.next();
  record.receiver = addresses_.next();
  record.amount = utl::roundTo(amountDist_(rng_), AMOUNT_DECIMALS);
  return record;
}

SyntheticSource::Roe<std::vector<TransactionRecord>>
SyntheticSource::fetch(size_t count) {
  std::vector<TransactionRecord> records;
  records.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    records.push_back(generate());
  }
  return records;
}

} // namespace feed
} // namespace pos
