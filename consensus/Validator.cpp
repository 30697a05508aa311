#include "Validator.h"
#include "../lib/Utilities.h"

#include <cmath>
#include <stdexcept>

namespace pos {
namespace consensus {

Validator::Validator(const std::string &address, double stake,
                     const BlockChain &chain)
    : Module("pos.Validator"), address_(address), stake_(stake), chain_(chain) {
  if (!std::isfinite(stake) || stake <= 0) {
    throw std::invalid_argument("Validator stake must be positive: " +
                                std::to_string(stake));
  }
}

Block Validator::propose(const std::vector<Transaction> &transactions) const {
  const Block &tip = chain_.getLatestBlock();
  Block block(tip.getIndex() + 1, utl::getCurrentTimestamp(), transactions,
              tip.getHash(), address_);
  log().info << "Validator " << utl::tail(address_, 8) << " PROPOSES " << block;
  return block;
}

bool Validator::validate(const Block &candidate) const {
  bool isValid = chain_.isValidBlock(candidate, chain_.getLatestBlock());
  if (isValid) {
    log().debug << "Validator " << utl::tail(address_, 8)
                << " votes YES for block #" << candidate.getIndex();
  } else {
    log().warning << "Validator " << utl::tail(address_, 8)
                  << " votes NO for block #" << candidate.getIndex();
  }
  return isValid;
}

} // namespace consensus
} // namespace pos
