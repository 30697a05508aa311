#pragma once

#include "../lib/ResultOrError.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace pos {
namespace consensus {

/**
 * Stake-weighted choice over a fixed set of weights
 *
 * Keeps the cumulative stake table; a single uniform draw in
 * [0, totalStake) is mapped to the first entry whose cumulative stake
 * exceeds it. Entry i is chosen with probability stake[i] / totalStake.
 */
class StakeSelector {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EMPTY = 1; // No entries
  constexpr static int32_t E_STAKE = 2; // Non-positive or non-finite stake

  /**
   * Build from per-entry stakes, all of which must be positive
   */
  static Roe<StakeSelector> create(const std::vector<double> &stakes);

  double getTotalStake() const { return totalStake_; }
  size_t size() const { return cumulative_.size(); }

  /**
   * Map a point in [0, totalStake) to an entry index.
   * Points outside the range are clamped to the first or last entry.
   */
  size_t indexFor(double point) const;

  size_t select(std::mt19937_64 &rng) const;

private:
  StakeSelector() = default;

  std::vector<double> cumulative_;
  double totalStake_{ 0 };
};

} // namespace consensus
} // namespace pos
