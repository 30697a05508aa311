#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace pos {
namespace feed {

/**
 * Produces account identities: "0x" followed by 40 hex characters (20 random
 * bytes) with mixed-case checksum. A letter is upper case when the matching
 * nibble of SHA-256 over the lower case hex is 8 or more.
 */
class AddressGenerator {
public:
  constexpr static size_t ADDRESS_BYTES = 20;

  explicit AddressGenerator(std::mt19937_64 &rng);

  std::string next();

  /**
   * Apply the checksum casing to 40 hex characters (with or without "0x")
   * @return "0x"-prefixed checksummed address, empty if input is malformed
   */
  static std::string toChecksumAddress(const std::string &hex);

  /** Format and checksum check */
  static bool isValidAddress(const std::string &address);

private:
  std::mt19937_64 &rng_;
};

} // namespace feed
} // namespace pos
