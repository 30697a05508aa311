#include "Simulator.h"
#include "../feed/HttpSource.h"
#include "../lib/Utilities.h"

#include <cmath>
#include <iomanip>
#include <stdexcept>

namespace pos {
namespace consensus {

// ----- Config -----

nlohmann::json Simulator::Config::ltsToJson() const {
  nlohmann::json j;
  j["validatorCount"] = validatorCount;
  j["baseStake"] = baseStake;
  j["stakeJitterMin"] = stakeJitterMin;
  j["stakeJitterMax"] = stakeJitterMax;
  j["stakes"] = stakes;
  j["batchSize"] = batchSize;
  j["lowWatermark"] = lowWatermark;
  j["refillMin"] = refillMin;
  j["refillMax"] = refillMax;
  j["threshold"] = threshold;
  if (seed) {
    j["seed"] = *seed;
  } else {
    j["seed"] = nullptr;
  }
  j["feed"] = { { "enabled", feed.enabled },
                { "baseUrl", feed.baseUrl },
                { "path", feed.path },
                { "timeoutMs", feed.timeoutMs } };
  return j;
}

namespace {

// Optional-key readers: an absent key leaves the value untouched, a present
// key of the wrong type fills error and returns false.

bool readUnsigned(const nlohmann::json &jd, const char *key, uint64_t &value,
                  std::string &error) {
  if (!jd.contains(key)) {
    return true;
  }
  if (!jd.at(key).is_number_unsigned()) {
    error = std::string("'") + key + "' must be a non-negative integer";
    return false;
  }
  value = jd.at(key).get<uint64_t>();
  return true;
}

bool readNumber(const nlohmann::json &jd, const char *key, double &value,
                std::string &error) {
  if (!jd.contains(key)) {
    return true;
  }
  if (!jd.at(key).is_number()) {
    error = std::string("'") + key + "' must be a number";
    return false;
  }
  value = jd.at(key).get<double>();
  return true;
}

bool readString(const nlohmann::json &jd, const char *key, std::string &value,
                std::string &error) {
  if (!jd.contains(key)) {
    return true;
  }
  if (!jd.at(key).is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  value = jd.at(key).get<std::string>();
  return true;
}

bool readBool(const nlohmann::json &jd, const char *key, bool &value,
              std::string &error) {
  if (!jd.contains(key)) {
    return true;
  }
  if (!jd.at(key).is_boolean()) {
    error = std::string("'") + key + "' must be a boolean";
    return false;
  }
  value = jd.at(key).get<bool>();
  return true;
}

bool readStakes(const nlohmann::json &jd, std::vector<double> &stakes,
                std::string &error) {
  if (!jd.contains("stakes")) {
    return true;
  }
  const auto &js = jd.at("stakes");
  if (!js.is_array()) {
    error = "'stakes' must be an array of numbers";
    return false;
  }
  std::vector<double> values;
  for (const auto &item : js) {
    if (!item.is_number()) {
      error = "'stakes' must be an array of numbers";
      return false;
    }
    values.push_back(item.get<double>());
  }
  stakes = values;
  return true;
}

bool readSeed(const nlohmann::json &jd, std::optional<uint64_t> &seed,
              std::string &error) {
  if (!jd.contains("seed")) {
    return true;
  }
  if (jd.at("seed").is_null()) {
    seed.reset();
    return true;
  }
  uint64_t value = 0;
  if (!readUnsigned(jd, "seed", value, error)) {
    return false;
  }
  seed = value;
  return true;
}

} // namespace

Simulator::Roe<void> Simulator::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  // Parse into a copy so a rejected document leaves this config unchanged
  Config parsed = *this;
  std::string error;
  if (!readUnsigned(jd, "validatorCount", parsed.validatorCount, error) ||
      !readNumber(jd, "baseStake", parsed.baseStake, error) ||
      !readNumber(jd, "stakeJitterMin", parsed.stakeJitterMin, error) ||
      !readNumber(jd, "stakeJitterMax", parsed.stakeJitterMax, error) ||
      !readStakes(jd, parsed.stakes, error) ||
      !readUnsigned(jd, "batchSize", parsed.batchSize, error) ||
      !readUnsigned(jd, "lowWatermark", parsed.lowWatermark, error) ||
      !readUnsigned(jd, "refillMin", parsed.refillMin, error) ||
      !readUnsigned(jd, "refillMax", parsed.refillMax, error) ||
      !readNumber(jd, "threshold", parsed.threshold, error) ||
      !readSeed(jd, parsed.seed, error)) {
    return Error(E_CONFIG, "Invalid configuration: " + error);
  }

  if (jd.contains("feed")) {
    const auto &jf = jd.at("feed");
    if (!jf.is_object()) {
      return Error(E_CONFIG, "'feed' must be a JSON object");
    }
    if (!readBool(jf, "enabled", parsed.feed.enabled, error) ||
        !readString(jf, "baseUrl", parsed.feed.baseUrl, error) ||
        !readString(jf, "path", parsed.feed.path, error) ||
        !readUnsigned(jf, "timeoutMs", parsed.feed.timeoutMs, error)) {
      return Error(E_CONFIG, "Invalid feed configuration: " + error);
    }
  }

  *this = parsed;
  return {};
}

void Simulator::Config::setValidatorCount(uint64_t count) {
  validatorCount = count;
  stakes.clear();
}

void Simulator::Config::setBaseStake(double stake) {
  baseStake = stake;
  stakes.clear();
}

// ----- Simulator -----

Simulator::Simulator(const std::string &loggerName)
    : Module(loggerName), rng_(std::random_device{}()), addresses_(rng_),
      synthetic_(rng_) {
  chain_.redirectLogger(log().getFullName() + ".Chain");
}

double Simulator::getTotalStake() const {
  double total = 0;
  for (const auto &validator : validators_) {
    total += validator->getStake();
  }
  return total;
}

bool Simulator::isThresholdMet(double approvingStake, double totalStake,
                               double threshold) {
  if (totalStake <= 0) {
    return false;
  }
  return approvingStake / totalStake >= threshold;
}

Simulator::Roe<void> Simulator::validateConfig(const Config &config) const {
  if (!std::isfinite(config.threshold) || config.threshold <= 0 ||
      config.threshold > 1) {
    return Error(E_CONFIG, "Threshold must be in (0, 1]: " +
                               std::to_string(config.threshold));
  }
  if (config.batchSize == 0) {
    return Error(E_CONFIG, "Batch size must be at least 1");
  }
  if (config.refillMin > config.refillMax) {
    return Error(E_CONFIG, "Refill range is empty: [" +
                               std::to_string(config.refillMin) + ", " +
                               std::to_string(config.refillMax) + "]");
  }

  if (!config.stakes.empty()) {
    for (double stake : config.stakes) {
      if (!std::isfinite(stake) || stake <= 0) {
        return Error(E_CONFIG, "Validator stake must be positive: " +
                                   std::to_string(stake));
      }
    }
  } else if (config.validatorCount > 0) {
    if (!std::isfinite(config.baseStake) || config.baseStake <= 0) {
      return Error(E_CONFIG, "Base stake must be positive: " +
                                 std::to_string(config.baseStake));
    }
    if (!std::isfinite(config.stakeJitterMin) || !std::isfinite(config.stakeJitterMax) ||
        config.stakeJitterMin <= 0 || config.stakeJitterMin > config.stakeJitterMax) {
      return Error(E_CONFIG, "Stake jitter must satisfy 0 < min <= max");
    }
  }

  if (config.feed.enabled && config.feed.baseUrl.empty()) {
    return Error(E_CONFIG, "Feed is enabled but has no base URL");
  }
  return {};
}

Simulator::Roe<void> Simulator::init(const Config &config) {
  auto valid = validateConfig(config);
  if (!valid) {
    return valid.error();
  }

  config_ = config;
  if (config_.seed) {
    rng_.seed(*config_.seed);
    log().info << "Random engine seeded with " << *config_.seed;
  }

  validators_.clear();
  auto created = createValidators();
  if (!created) {
    return created.error();
  }

  pool_ = TransactionPool();
  source_.reset();
  if (config_.feed.enabled) {
    feed::HttpSource::Config httpConfig;
    httpConfig.baseUrl = config_.feed.baseUrl;
    httpConfig.path = config_.feed.path;
    httpConfig.connectTimeoutMs = config_.feed.timeoutMs;
    httpConfig.readTimeoutMs = config_.feed.timeoutMs;
    auto source = std::make_unique<feed::HttpSource>(httpConfig, synthetic_);
    source->redirectLogger(log().getFullName() + ".Feed");
    source_ = std::move(source);
    log().info << "Using remote feed " << source_->getName();
  }

  log().info << "Simulator initialized with " << validators_.size()
             << " validators, total stake " << std::fixed
             << std::setprecision(2) << getTotalStake();
  return {};
}

Simulator::Roe<void> Simulator::init(uint64_t validatorCount, double baseStake) {
  Config config;
  config.validatorCount = validatorCount;
  config.baseStake = baseStake;
  return init(config);
}

Simulator::Roe<void> Simulator::createValidators() {
  std::vector<double> stakes = config_.stakes;
  if (stakes.empty()) {
    std::uniform_real_distribution<double> jitter(config_.stakeJitterMin,
                                                  config_.stakeJitterMax);
    for (uint64_t i = 0; i < config_.validatorCount; ++i) {
      stakes.push_back(config_.baseStake * jitter(rng_));
    }
  }

  for (double stake : stakes) {
    auto added = addValidator(addresses_.next(), stake);
    if (!added) {
      return added.error();
    }
  }
  return {};
}

Simulator::Roe<void> Simulator::addValidator(std::unique_ptr<Validator> validator) {
  if (!validator) {
    return Error(E_INPUT, "Validator is null");
  }
  if (&validator->getChain() != &chain_) {
    return Error(E_INPUT, "Validator " + validator->getAddress() +
                              " is bound to another chain");
  }

  validator->redirectLogger(log().getFullName() + ".Validator");
  log().info << "Validator " << utl::tail(validator->getAddress(), 8)
             << " initialized with stake: " << std::fixed
             << std::setprecision(2) << validator->getStake();
  validators_.push_back(std::move(validator));
  return {};
}

Simulator::Roe<void> Simulator::addValidator(const std::string &address,
                                             double stake) {
  std::unique_ptr<Validator> validator;
  try {
    validator = std::make_unique<Validator>(address, stake, chain_);
  } catch (const std::invalid_argument &e) {
    return Error(E_INPUT, e.what());
  }
  return addValidator(std::move(validator));
}

void Simulator::setTransactionSource(
    std::unique_ptr<feed::TransactionSource> source) {
  source_ = std::move(source);
}

void Simulator::submitTransaction(const Transaction &tx) { pool_.add(tx); }

Simulator::Roe<size_t> Simulator::selectLeader() {
  std::vector<double> stakes;
  stakes.reserve(validators_.size());
  for (const auto &validator : validators_) {
    stakes.push_back(validator->getStake());
  }

  auto selector = StakeSelector::create(stakes);
  if (!selector) {
    return Error(E_STATE, "Cannot select leader: " + selector.error().message);
  }

  size_t index = selector.value().select(rng_);
  const Validator &leader = *validators_[index];
  log().info << "Leader for round #" << chain_.getLatestBlock().getIndex() + 1
             << " selected: " << utl::tail(leader.getAddress(), 8)
             << " (Stake: " << std::fixed << std::setprecision(2)
             << leader.getStake() << ")";
  return index;
}

Simulator::Roe<void> Simulator::refillPool() {
  if (pool_.size() >= config_.lowWatermark) {
    return {};
  }

  std::uniform_int_distribution<uint64_t> countDist(config_.refillMin,
                                                    config_.refillMax);
  size_t count = countDist(rng_);

  std::vector<feed::TransactionRecord> records;
  if (source_) {
    log().info << "Fetching " << count << " transactions from "
               << source_->getName() << "...";
    auto fetched = source_->fetch(count);
    if (fetched) {
      records = fetched.value();
    } else {
      log().error << "Failed to fetch transactions: "
                  << fetched.error().message << ". Generating locally.";
      auto generated = synthetic_.fetch(count);
      if (!generated) {
        return Error(E_SOURCE_INPUT, generated.error().message);
      }
      records = generated.value();
    }
  } else {
    log().info << "Generating " << count << " transactions locally...";
    auto generated = synthetic_.fetch(count);
    if (!generated) {
      return Error(E_SOURCE_INPUT, generated.error().message);
    }
    records = generated.value();
  }

  // Convert the whole batch first so a bad record leaves the pool untouched
  std::vector<Transaction> txes;
  txes.reserve(records.size());
  for (const auto &record : records) {
    auto tx = Transaction::create(record.sender, record.receiver, record.amount,
                                  record.data);
    if (!tx) {
      return Error(E_SOURCE_INPUT, "Malformed transaction record from " +
                                       record.sender + ": " + tx.error().message);
    }
    txes.push_back(tx.value());
  }

  pool_.add(txes);
  log().info << "Added " << txes.size() << " new transactions to the mempool.";
  return {};
}

void Simulator::enter(RoundResult &result, RoundState state) const {
  result.state = state;
  log().debug << "Round #" << result.blockIndex << " -> " << state;
}

Simulator::Roe<Simulator::RoundResult> Simulator::runRound() {
  return runRoundFrom(std::nullopt);
}

Simulator::Roe<Simulator::RoundResult>
Simulator::runRoundWithLeader(size_t leaderIndex) {
  if (leaderIndex >= validators_.size()) {
    return Error(E_INPUT, "Leader index " + std::to_string(leaderIndex) +
                              " out of range (" +
                              std::to_string(validators_.size()) + " validators)");
  }
  return runRoundFrom(leaderIndex);
}

Simulator::Roe<Simulator::RoundResult>
Simulator::runRoundFrom(std::optional<size_t> leaderIndex) {
  if (validators_.empty()) {
    return Error(E_STATE, "No validators registered");
  }

  RoundResult result;
  result.blockIndex = chain_.getLatestBlock().getIndex() + 1;
  log().info << "--- Starting Consensus Round for Block #" << result.blockIndex
             << " ---";

  enter(result, RoundState::POOLING);
  auto refilled = refillPool();
  if (!refilled) {
    return refilled.error();
  }
  if (pool_.empty()) {
    log().warning << "Mempool is empty. Skipping round.";
    result.reason = RejectReason::EMPTY_POOL;
    enter(result, RoundState::REJECTED);
    return result;
  }

  if (!leaderIndex) {
    auto selected = selectLeader();
    if (!selected) {
      return selected.error();
    }
    leaderIndex = selected.value();
  } else {
    const Validator &leader = *validators_[*leaderIndex];
    log().info << "Leader for round #" << result.blockIndex
               << " assigned: " << utl::tail(leader.getAddress(), 8)
               << " (Stake: " << std::fixed << std::setprecision(2)
               << leader.getStake() << ")";
  }
  return executeRound(*leaderIndex, result);
}

Simulator::Roe<Simulator::RoundResult>
Simulator::executeRound(size_t leaderIndex, RoundResult result) {
  const Validator &leader = *validators_[leaderIndex];
  result.leader = leader.getAddress();
  enter(result, RoundState::LEADER_SELECTED);

  std::vector<Transaction> batch = pool_.peek(config_.batchSize);
  Block candidate = leader.propose(batch);
  result.txCount = batch.size();
  enter(result, RoundState::PROPOSED);

  result.totalStake = getTotalStake();
  for (const auto &validator : validators_) {
    // The leader approves its own block without re-validating it
    if (validator.get() == &leader || validator->validate(candidate)) {
      result.approvingStake += validator->getStake();
    }
  }
  enter(result, RoundState::VOTED);

  log().info << "Consensus check: Approving stake " << std::fixed
             << std::setprecision(2) << result.approvingStake << "/"
             << result.totalStake;

  if (!isThresholdMet(result.approvingStake, result.totalStake,
                      config_.threshold)) {
    log().warning << "CONSENSUS FAILED for block #" << candidate.getIndex()
                  << ". Block discarded.";
    result.reason = RejectReason::CONSENSUS_NOT_REACHED;
    enter(result, RoundState::REJECTED);
    return result;
  }

  if (!chain_.addBlock(candidate)) {
    log().critical << "Block #" << candidate.getIndex()
                   << " failed final validation despite consensus";
    return Error(E_CHAIN_CONSISTENCY,
                 "Approved block #" + std::to_string(candidate.getIndex()) +
                     " rejected by the chain");
  }

  pool_.drain(batch.size());
  result.blockHash = candidate.getHash();
  enter(result, RoundState::COMMITTED);
  log().info << "CONSENSUS REACHED. " << candidate << " added to the chain.";
  return result;
}

// ----- printing -----

std::ostream &operator<<(std::ostream &os, Simulator::RoundState state) {
  switch (state) {
  case Simulator::RoundState::POOLING:
    return os << "POOLING";
  case Simulator::RoundState::LEADER_SELECTED:
    return os << "LEADER_SELECTED";
  case Simulator::RoundState::PROPOSED:
    return os << "PROPOSED";
  case Simulator::RoundState::VOTED:
    return os << "VOTED";
  case Simulator::RoundState::COMMITTED:
    return os << "COMMITTED";
  case Simulator::RoundState::REJECTED:
    return os << "REJECTED";
  }
  return os << "UNKNOWN";
}

std::ostream &operator<<(std::ostream &os, Simulator::RejectReason reason) {
  switch (reason) {
  case Simulator::RejectReason::NONE:
    return os << "NONE";
  case Simulator::RejectReason::EMPTY_POOL:
    return os << "EMPTY_POOL";
  case Simulator::RejectReason::CONSENSUS_NOT_REACHED:
    return os << "CONSENSUS_NOT_REACHED";
  }
  return os << "UNKNOWN";
}

std::ostream &operator<<(std::ostream &os,
                         const Simulator::RoundResult &result) {
  os << "Round(#" << result.blockIndex << " | " << result.state;
  if (result.reason != Simulator::RejectReason::NONE) {
    os << " " << result.reason;
  }
  if (!result.leader.empty()) {
    os << " | Leader: " << utl::tail(result.leader, 8);
  }
  if (result.totalStake > 0) {
    os << " | Stake: " << std::fixed << std::setprecision(2)
       << result.approvingStake << "/" << result.totalStake;
  }
  if (result.isCommitted()) {
    os << " | Txs: " << result.txCount << " | Hash: "
       << utl::tail(result.blockHash, 6);
  }
  return os << ")";
}

std::ostream &operator<<(std::ostream &os, const Simulator::Config &config) {
  os << "Simulator Configuration:\n";
  if (config.stakes.empty()) {
    os << "  Validators: " << config.validatorCount << "\n";
    os << "  Base stake: " << config.baseStake << " x U(" << config.stakeJitterMin
       << ", " << config.stakeJitterMax << ")\n";
  } else {
    os << "  Validators: " << config.stakes.size() << " (explicit stakes)\n";
  }
  os << "  Batch size: " << config.batchSize << "\n";
  os << "  Pool refill: " << config.refillMin << "-" << config.refillMax
     << " below " << config.lowWatermark << "\n";
  os << "  Threshold: " << config.threshold << "\n";
  os << "  Seed: " << (config.seed ? std::to_string(*config.seed) : "random") << "\n";
  os << "  Feed: " << (config.feed.enabled ? config.feed.baseUrl + config.feed.path : "local") << "\n";
  return os;
}

} // namespace consensus
} // namespace pos
