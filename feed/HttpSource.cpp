#include "HttpSource.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>

namespace pos {
namespace feed {

HttpSource::HttpSource(const Config &config, SyntheticSource &filler)
    : Module("pos.HttpSource"), config_(config), filler_(filler) {}

HttpSource::Roe<std::vector<TransactionRecord>> HttpSource::fetch(size_t count) {
  httplib::Client client(config_.baseUrl);
  if (!client.is_valid()) {
    return Error(E_TRANSPORT, "Invalid feed URL: " + config_.baseUrl);
  }
  client.set_connection_timeout(
      std::chrono::milliseconds(config_.connectTimeoutMs));
  client.set_read_timeout(std::chrono::milliseconds(config_.readTimeoutMs));

  std::string target = config_.path + "?_limit=" + std::to_string(count);
  log().debug << "GET " << config_.baseUrl << target;

  auto res = client.Get(target);
  if (!res) {
    return Error(E_TRANSPORT, "Request to " + config_.baseUrl + target +
                                  " failed: " + httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    return Error(E_STATUS, "Feed returned HTTP " + std::to_string(res->status));
  }

  return parseBody(res->body, count);
}

HttpSource::Roe<std::vector<TransactionRecord>>
HttpSource::parseBody(const std::string &body, size_t count) {
  nlohmann::json items;
  try {
    items = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_PAYLOAD, "Failed to parse feed response: " + std::string(e.what()));
  }

  if (!items.is_array()) {
    return Error(E_PAYLOAD, "Feed response is not a JSON array");
  }

  std::vector<TransactionRecord> records;
  for (const auto &item : items) {
    if (records.size() >= count) {
      break;
    }
    TransactionRecord record = filler_.generate();
    std::string title = "N/A";
    if (item.is_object() && item.contains("title") && item["title"].is_string()) {
      title = item["title"].get<std::string>();
    }
    record.data["api_title"] = title;
    records.push_back(record);
  }

  log().debug << "Feed delivered " << records.size() << " records";
  return records;
}

} // namespace feed
} // namespace pos
