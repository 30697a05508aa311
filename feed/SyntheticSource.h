#pragma once

#include "AddressGenerator.h"
#include "TransactionSource.h"

#include <random>

namespace pos {
namespace feed {

/**
 * Local generator used when no remote feed is configured or the feed fails.
 * Parties are fresh random addresses; amounts are uniform in
 * [MIN_AMOUNT, MAX_AMOUNT] rounded to AMOUNT_DECIMALS places.
 */
class SyntheticSource : public TransactionSource {
public:
  constexpr static double MIN_AMOUNT = 0.1;
  constexpr static double MAX_AMOUNT = 10.0;
  constexpr static int AMOUNT_DECIMALS = 4;

  explicit SyntheticSource(std::mt19937_64 &rng);
  ~SyntheticSource() override = default;

  /** Always succeeds with exactly count records */
  Roe<std::vector<TransactionRecord>> fetch(size_t count) override;

  std::string getName() const override { return "synthetic"; }

  /** One record without metadata */
  TransactionRecord generate();

private:
  std::mt19937_64 &rng_;
  AddressGenerator addresses_;
  std::uniform_real_distribution<double> amountDist_;
};

} // namespace feed
} // namespace pos
