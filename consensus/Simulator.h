#pragma once

#include "StakeSelector.h"
#include "TransactionPool.h"
#include "Validator.h"
#include "../feed/AddressGenerator.h"
#include "../feed/SyntheticSource.h"
#include "../feed/TransactionSource.h"
#include "../ledger/BlockChain.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pos {
namespace consensus {

/**
 * Simulator - runs stake-weighted consensus rounds over one in-process chain
 *
 * Owns the chain, the validator set, the pending pool, the random engine and
 * the transaction sources. Each round goes through
 *   POOLING -> LEADER_SELECTED -> PROPOSED -> VOTED -> COMMITTED | REJECTED
 * and never overlaps another round.
 */
class Simulator : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;            // Invalid configuration
  constexpr static int32_t E_STATE = 2;             // No validators to run a round
  constexpr static int32_t E_INPUT = 3;             // Invalid argument
  constexpr static int32_t E_SOURCE_INPUT = 4;      // Malformed record from a source
  constexpr static int32_t E_CHAIN_CONSISTENCY = 5; // Approved block failed append

  struct FeedConfig {
    bool enabled{ false };
    std::string baseUrl{ "https://jsonplaceholder.typicode.com" };
    std::string path{ "/posts" };
    uint64_t timeoutMs{ 5000 };
  };

  struct Config {
    uint64_t validatorCount{ 10 };
    double baseStake{ 1000.0 };
    double stakeJitterMin{ 0.8 }; // stake = baseStake * U(min, max)
    double stakeJitterMax{ 1.5 };
    std::vector<double> stakes;   // explicit stakes, replaces count/base/jitter
    uint64_t batchSize{ 5 };
    uint64_t lowWatermark{ 5 };
    uint64_t refillMin{ 5 };
    uint64_t refillMax{ 10 };
    double threshold{ 2.0 / 3.0 };
    std::optional<uint64_t> seed;
    FeedConfig feed;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);

    // Both switch to generated stakes, dropping an explicit stakes list
    void setValidatorCount(uint64_t count);
    void setBaseStake(double stake);
  };

  enum class RoundState {
    POOLING,
    LEADER_SELECTED,
    PROPOSED,
    VOTED,
    COMMITTED,
    REJECTED
  };

  enum class RejectReason { NONE, EMPTY_POOL, CONSENSUS_NOT_REACHED };

  struct RoundResult {
    RoundState state{ RoundState::POOLING };
    RejectReason reason{ RejectReason::NONE };
    uint64_t blockIndex{ 0 };
    std::string leader;
    std::string blockHash;  // set when committed
    size_t txCount{ 0 };
    double approvingStake{ 0 };
    double totalStake{ 0 };

    bool isCommitted() const { return state == RoundState::COMMITTED; }
  };

  /**
   * @param loggerName Logger the simulator and its components write to
   */
  explicit Simulator(const std::string &loggerName = "pos.Simulator");
  ~Simulator() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  const BlockChain &getChain() const { return chain_; }
  const TransactionPool &getPool() const { return pool_; }
  size_t getValidatorCount() const { return validators_.size(); }
  const Validator &getValidator(size_t index) const { return *validators_.at(index); }
  double getTotalStake() const;

  /** Commit rule: approving / total >= threshold (ties commit) */
  static bool isThresholdMet(double approvingStake, double totalStake,
                             double threshold);

  // ----- methods -----
  /**
   * Validate the configuration, reseed and create the validator set.
   * Existing validators and pool contents are dropped; the chain is kept.
   */
  Roe<void> init(const Config &config);

  /** Shorthand for init() with a validator count and base stake */
  Roe<void> init(uint64_t validatorCount, double baseStake);

  /** Add a validator created on this simulator's chain */
  Roe<void> addValidator(std::unique_ptr<Validator> validator);
  Roe<void> addValidator(const std::string &address, double stake);

  /** Replace the primary transaction source (the synthetic one stays as fallback) */
  void setTransactionSource(std::unique_ptr<feed::TransactionSource> source);

  void submitTransaction(const Transaction &tx);

  /** Draw a leader index with probability proportional to stake */
  Roe<size_t> selectLeader();

  /**
   * Run one full round.
   * Rejections are results; errors are reserved for a missing validator set,
   * malformed source input and chain consistency violations.
   */
  Roe<RoundResult> runRound();

  /** Run one round with a leader chosen by the caller instead of a draw */
  Roe<RoundResult> runRoundWithLeader(size_t leaderIndex);

private:
  Roe<void> validateConfig(const Config &config) const;
  Roe<void> createValidators();
  Roe<void> refillPool();
  Roe<RoundResult> runRoundFrom(std::optional<size_t> leaderIndex);
  Roe<RoundResult> executeRound(size_t leaderIndex, RoundResult result);
  void enter(RoundResult &result, RoundState state) const;

  Config config_;
  std::mt19937_64 rng_;
  BlockChain chain_;
  TransactionPool pool_;
  std::vector<std::unique_ptr<Validator>> validators_;
  feed::AddressGenerator addresses_;
  feed::SyntheticSource synthetic_;
  std::unique_ptr<feed::TransactionSource> source_;
};

std::ostream &operator<<(std::ostream &os, Simulator::RoundState state);
std::ostream &operator<<(std::ostream &os, Simulator::RejectReason reason);
std::ostream &operator<<(std::ostream &os, const Simulator::RoundResult &result);
std::ostream &operator<<(std::ostream &os, const Simulator::Config &config);

} // namespace consensus
} // namespace pos
