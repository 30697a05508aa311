#include "StakeSelector.h"

#include <algorithm>
#include <cmath>

namespace pos {
namespace consensus {

StakeSelector::Roe<StakeSelector>
StakeSelector::create(const std::vector<double> &stakes) {
  if (stakes.empty()) {
    return Error(E_EMPTY, "No stakes to select from");
  }

  StakeSelector selector;
  selector.cumulative_.reserve(stakes.size());
  double running = 0;
  for (size_t i = 0; i < stakes.size(); ++i) {
    if (!std::isfinite(stakes[i]) || stakes[i] <= 0) {
      return Error(E_STAKE, "Stake at position " + std::to_string(i) +
                                " must be positive");
    }
    running += stakes[i];
    selector.cumulative_.push_back(running);
  }
  selector.totalStake_ = running;
  return selector;
}

size_t StakeSelector::indexFor(double point) const {
  auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), point);
  if (it == cumulative_.end()) {
    return cumulative_.size() - 1;
  }
  return static_cast<size_t>(it - cumulative_.begin());
}

size_t StakeSelector::select(std::mt19937_64 &rng) const {
  std::uniform_real_distribution<double> dist(0.0, totalStake_);
  return indexFor(dist(rng));
}

} // namespace consensus
} // namespace pos
