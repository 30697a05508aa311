#pragma once

#include "../ledger/Block.h"
#include "../ledger/BlockChain.h"
#include "../ledger/Transaction.h"
#include "../lib/Module.h"

#include <string>
#include <vector>

namespace pos {
namespace consensus {

/**
 * Validator - staking participant with a read-only view of the chain
 *
 * Proposes blocks on top of the current tip and votes on candidates by
 * re-running the chain's own block check. Never mutates the chain.
 */
class Validator : public Module {
public:
  /**
   * @throws std::invalid_argument if stake is not a positive finite number
   */
  Validator(const std::string &address, double stake, const BlockChain &chain);
  ~Validator() override = default;

  const std::string &getAddress() const { return address_; }
  double getStake() const { return stake_; }
  const BlockChain &getChain() const { return chain_; }

  /**
   * Build a block extending the current tip with the given batch, in the
   * given order. The chain is not touched.
   */
  Block propose(const std::vector<Transaction> &transactions) const;

  /**
   * Vote on a candidate against the tip as it is now, not as it was when
   * the candidate was proposed.
   */
  virtual bool validate(const Block &candidate) const;

private:
  std::string address_;
  double stake_{ 0 };
  const BlockChain &chain_;
};

} // namespace consensus
} // namespace pos
