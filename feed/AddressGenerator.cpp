#include "AddressGenerator.h"
#include "../lib/Utilities.h"

#include <cctype>

namespace pos {
namespace feed {

AddressGenerator::AddressGenerator(std::mt19937_64 &rng) : rng_(rng) {}

std::string AddressGenerator::next() {
  std::uniform_int_distribution<int> byteDist(0, 255);
  std::string raw;
  raw.reserve(ADDRESS_BYTES);
  for (size_t i = 0; i < ADDRESS_BYTES; ++i) {
    raw.push_back(static_cast<char>(byteDist(rng_)));
  }
  return toChecksumAddress(utl::hexEncode(raw));
}

std::string AddressGenerator::toChecksumAddress(const std::string &hex) {
  std::string body = hex;
  if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
    body = body.substr(2);
  }
  if (!utl::isHex(body, ADDRESS_BYTES * 2)) {
    return "";
  }

  for (auto &c : body) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  std::string digest = utl::sha256(body);
  std::string out = "0x";
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c >= 'a' && c <= 'f') {
      char d = digest[i];
      int nibble = (d >= 'a') ? (d - 'a' + 10) : (d - '0');
      if (nibble >= 8) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      }
    }
    out.push_back(c);
  }
  return out;
}

bool AddressGenerator::isValidAddress(const std::string &address) {
  if (address.size() != 2 + ADDRESS_BYTES * 2 || address.compare(0, 2, "0x") != 0) {
    return false;
  }
  return toChecksumAddress(address) == address;
}

} // namespace feed
} // namespace pos
