#include "Utilities.h"

#include <sodium.h>

#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pos {
namespace utl {

// Initialize libsodium once per process
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

double getCurrentTimestamp() {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return static_cast<double>(us) / 1e6;
}

std::string formatTimestamp(double timestamp) {
  double whole = std::floor(timestamp);
  auto micros = static_cast<int64_t>(std::llround((timestamp - whole) * 1e6));
  auto seconds = static_cast<time_t>(whole);
  if (micros >= 1000000) {
    micros -= 1000000;
    ++seconds;
  }

  std::tm local{};
  if (!localtime_r(&seconds, &local)) {
    return std::to_string(timestamp);
  }

  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  if (micros > 0) {
    ss << '.' << std::setfill('0') << std::setw(6) << micros;
  }
  return ss.str();
}

double roundTo(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

std::string tail(const std::string &str, size_t n) {
  if (str.size() <= n) {
    return str;
  }
  return str.substr(str.size() - n);
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

bool isHex(const std::string &str, size_t length) {
  if (str.empty() || (length != 0 && str.size() != length)) {
    return false;
  }
  for (char c : str) {
    bool digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                 (c >= 'A' && c <= 'F');
    if (!digit) {
      return false;
    }
  }
  return true;
}

pos::Roe<nlohmann::json> loadJsonFile(const std::string &filePath) {
  if (!std::filesystem::exists(filePath)) {
    return Error(1, "File not found: " + filePath);
  }

  std::ifstream file(filePath);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + filePath);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return json;
}

pos::Roe<void> writeToNewFile(const std::string &filePath,
                              const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream file(filePath, std::ios::binary);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }
  file << content;
  if (!file.good()) {
    return Error(4, "Failed to write file: " + filePath);
  }
  return {};
}

} // namespace utl
} // namespace pos
