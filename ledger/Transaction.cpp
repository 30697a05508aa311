#include "Transaction.h"
#include "../lib/Utilities.h"

#include <cmath>

namespace pos {

Transaction::Transaction(const std::string &sender, const std::string &receiver,
                         double amount, const Metadata &data, double timestamp)
    : sender_(sender), receiver_(receiver), amount_(amount), data_(data),
      timestamp_(timestamp) {}

Transaction::Roe<Transaction>
Transaction::create(const std::string &sender, const std::string &receiver,
                    double amount, const Metadata &data) {
  return create(sender, receiver, amount, data, utl::getCurrentTimestamp());
}

Transaction::Roe<Transaction>
Transaction::create(const std::string &sender, const std::string &receiver,
                    double amount, const Metadata &data, double timestamp) {
  if (!std::isfinite(amount) || amount < 0) {
    return Error(E_AMOUNT, "Invalid transaction amount: " + std::to_string(amount));
  }
  return Transaction(sender, receiver, amount, data, timestamp);
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["sender"] = sender_;
  j["receiver"] = receiver_;
  j["amount"] = amount_;
  j["data"] = nlohmann::json::object();
  for (const auto &[key, value] : data_) {
    j["data"][key] = value;
  }
  j["timestamp"] = timestamp_;
  return j;
}

Transaction::Roe<Transaction> Transaction::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Transaction must be a JSON object");
  }
  if (!jd.contains("sender") || !jd["sender"].is_string() ||
      !jd.contains("receiver") || !jd["receiver"].is_string()) {
    return Error(E_FORMAT, "Transaction missing 'sender' or 'receiver'");
  }
  if (!jd.contains("amount") || !jd["amount"].is_number()) {
    return Error(E_FORMAT, "Transaction missing numeric 'amount'");
  }
  if (!jd.contains("timestamp") || !jd["timestamp"].is_number()) {
    return Error(E_FORMAT, "Transaction missing numeric 'timestamp'");
  }

  Metadata data;
  if (jd.contains("data")) {
    if (!jd["data"].is_object()) {
      return Error(E_FORMAT, "Transaction 'data' must be an object");
    }
    for (const auto &[key, value] : jd["data"].items()) {
      if (!value.is_string()) {
        return Error(E_FORMAT, "Transaction 'data' values must be strings");
      }
      data[key] = value.get<std::string>();
    }
  }

  return create(jd["sender"].get<std::string>(),
                jd["receiver"].get<std::string>(), jd["amount"].get<double>(),
                data, jd["timestamp"].get<double>());
}

bool Transaction::operator==(const Transaction &other) const {
  return sender_ == other.sender_ && receiver_ == other.receiver_ &&
         amount_ == other.amount_ && data_ == other.data_ &&
         timestamp_ == other.timestamp_;
}

std::ostream &operator<<(std::ostream &os, const Transaction &tx) {
  os << "TX(" << utl::tail(tx.getSender(), 6) << " -> "
     << utl::tail(tx.getReceiver(), 6) << ": " << tx.getAmount() << ")";
  return os;
}

} // namespace pos
