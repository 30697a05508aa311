#include "Block.h"
#include "../lib/Utilities.h"

namespace pos {

Block::Block(uint64_t index, double timestamp,
             const std::vector<Transaction> &transactions,
             const std::string &previousHash, const std::string &proposer)
    : index_(index), timestamp_(timestamp), transactions_(transactions),
      previousHash_(previousHash), proposer_(proposer) {
  hash_ = calculateHash();
}

nlohmann::json
Block::canonicalRecord(uint64_t index, double timestamp,
                       const std::vector<Transaction> &transactions,
                       const std::string &previousHash,
                       const std::string &proposer) {
  // nlohmann::json objects are key-ordered, so dump() is canonical
  nlohmann::json record;
  record["index"] = index;
  record["timestamp"] = timestamp;
  record["transactions"] = nlohmann::json::array();
  for (const auto &tx : transactions) {
    record["transactions"].push_back(tx.toJson());
  }
  record["previous_hash"] = previousHash;
  record["validator"] = proposer;
  return record;
}

std::string Block::calculateHash(uint64_t index, double timestamp,
                                 const std::vector<Transaction> &transactions,
                                 const std::string &previousHash,
                                 const std::string &proposer) {
  auto record =
      canonicalRecord(index, timestamp, transactions, previousHash, proposer);
  std::string encoded =
      record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return utl::sha256(encoded);
}

std::string Block::calculateHash() const {
  return calculateHash(index_, timestamp_, transactions_, previousHash_,
                       proposer_);
}

nlohmann::json Block::toJson() const {
  auto j = canonicalRecord(index_, timestamp_, transactions_, previousHash_,
                           proposer_);
  j["hash"] = hash_;
  return j;
}

Block::Roe<Block> Block::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Block must be a JSON object");
  }
  if (!jd.contains("index") || !jd["index"].is_number_unsigned()) {
    return Error(E_FORMAT, "Block missing unsigned 'index'");
  }
  if (!jd.contains("timestamp") || !jd["timestamp"].is_number()) {
    return Error(E_FORMAT, "Block missing numeric 'timestamp'");
  }
  if (!jd.contains("previous_hash") || !jd["previous_hash"].is_string()) {
    return Error(E_FORMAT, "Block missing 'previous_hash'");
  }
  if (!jd.contains("validator") || !jd["validator"].is_string()) {
    return Error(E_FORMAT, "Block missing 'validator'");
  }
  if (!jd.contains("hash") || !jd["hash"].is_string()) {
    return Error(E_FORMAT, "Block missing 'hash'");
  }
  if (!jd.contains("transactions") || !jd["transactions"].is_array()) {
    return Error(E_FORMAT, "Block missing 'transactions' array");
  }

  std::vector<Transaction> transactions;
  transactions.reserve(jd["transactions"].size());
  for (const auto &txJson : jd["transactions"]) {
    auto txResult = Transaction::ltsFromJson(txJson);
    if (!txResult) {
      return Error(E_FORMAT, "Invalid transaction in block: " +
                                 txResult.error().message);
    }
    transactions.push_back(txResult.value());
  }

  Block block(jd["index"].get<uint64_t>(), jd["timestamp"].get<double>(),
              transactions, jd["previous_hash"].get<std::string>(),
              jd["validator"].get<std::string>());
  block.hash_ = jd["hash"].get<std::string>();
  return block;
}

std::ostream &operator<<(std::ostream &os, const Block &block) {
  os << "Block(#" << block.getIndex()
     << " | Val: " << utl::tail(block.getProposer(), 6)
     << " | Txs: " << block.getTransactions().size()
     << " | Hash: " << utl::tail(block.getHash(), 6) << ")";
  return os;
}

} // namespace pos
