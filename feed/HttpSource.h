#pragma once

#include "SyntheticSource.h"
#include "TransactionSource.h"
#include "../lib/Module.h"

#include <cstdint>
#include <string>

namespace pos {
namespace feed {

/**
 * HttpSource - pulls records from a JSON list endpoint
 *
 * Issues GET <baseUrl><path>?_limit=<count> and turns each element of the
 * returned array into one record. The element's "title" becomes the
 * "api_title" metadata entry; parties and amount come from the synthetic
 * generator since the feed only supplies payload.
 */
class HttpSource : public Module, public TransactionSource {
public:
  struct Config {
    std::string baseUrl{ "https://jsonplaceholder.typicode.com" };
    std::string path{ "/posts" };
    uint64_t connectTimeoutMs{ 5000 };
    uint64_t readTimeoutMs{ 5000 };
  };

  HttpSource(const Config &config, SyntheticSource &filler);
  ~HttpSource() override = default;

  Roe<std::vector<TransactionRecord>> fetch(size_t count) override;

  std::string getName() const override { return config_.baseUrl + config_.path; }

  const Config &getConfig() const { return config_; }

  /**
   * Convert a response body to records
   * @param body JSON array of objects
   * @param count Maximum number of records to produce
   */
  Roe<std::vector<TransactionRecord>> parseBody(const std::string &body,
                                                size_t count);

private:
  Config config_;
  SyntheticSource &filler_;
};

} // namespace feed
} // namespace pos
