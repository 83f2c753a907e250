#include "utilities/digest.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dedupfs::utils {

namespace {
const char kHexChars[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}
} // namespace

std::string digest_to_hex(const DigestArray &digest) {
  std::string out;
  out.reserve(DIGEST_HEX_SIZE);
  for (uint8_t byte : digest) {
    out.push_back(kHexChars[byte >> 4]);
    out.push_back(kHexChars[byte & 0x0F]);
  }
  return out;
}

bool is_valid_hex_digest(const std::string &hex) {
  if (hex.size() != DIGEST_HEX_SIZE)
    return false;
  return std::all_of(hex.begin(), hex.end(),
                     [](char c) { return hex_value(c) >= 0; });
}

DigestArray hex_to_digest(const std::string &hex) {
  if (!is_valid_hex_digest(hex)) {
    throw std::invalid_argument("Invalid hex digest: '" + hex + "'");
  }
  DigestArray digest{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    digest[i] = static_cast<uint8_t>((hex_value(hex[2 * i]) << 4) |
                                     hex_value(hex[2 * i + 1]));
  }
  return digest;
}

HashAlgorithm parse_hash_algorithm(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  throw std::invalid_argument("Unknown hash algorithm: " + name);
}

std::string hash_algorithm_name(HashAlgorithm algo) {
  return algo == HashAlgorithm::BLAKE3 ? "blake3" : "sha256";
}

} // namespace dedupfs::utils
