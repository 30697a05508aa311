#ifndef POS_SIM_UTILITIES_H
#define POS_SIM_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace pos {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch with sub-second precision
 * @return Wall clock seconds as a double (microsecond resolution)
 */
double getCurrentTimestamp();

/**
 * Format a timestamp as local ISO-8601 time with microseconds,
 * e.g. "2025-10-30T11:28:39.123456"
 * @param timestamp Seconds since the epoch
 */
std::string formatTimestamp(double timestamp);

/**
 * Round to a fixed number of decimal places (half away from zero)
 */
double roundTo(double value, int decimals);

/**
 * Last n characters of a string, or the whole string if shorter
 */
std::string tail(const std::string &str, size_t n);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input bytes to hash
 * @return Lowercase hexadecimal string (64 characters)
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Check that a string consists only of hex digits
 * @param str String to check
 * @param length Required length, 0 for any non-empty length
 */
bool isHex(const std::string &str, size_t length = 0);

/**
 * Load and parse a JSON file
 * @param filePath Path to the JSON file
 * @return Parsed JSON or error (1: missing, 2: unreadable, 3: parse error)
 */
pos::Roe<nlohmann::json> loadJsonFile(const std::string &filePath);

/**
 * Write a string to a file that must not exist yet.
 * Creates parent directories if needed.
 * @param filePath Path to the file to write
 * @param content Content to write
 */
pos::Roe<void> writeToNewFile(const std::string &filePath,
                              const std::string &content);

} // namespace utl
} // namespace pos

#endif // POS_SIM_UTILITIES_H
