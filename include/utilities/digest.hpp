#ifndef DEDUPFS_DIGEST_HPP
#define DEDUPFS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dedupfs::utils {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

/// Length of a digest rendered as lowercase hex.
inline constexpr size_t DIGEST_HEX_SIZE = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Render a digest as 64 lowercase hex characters.
 */
std::string digest_to_hex(const DigestArray &digest);

/**
 * @brief Parse a 64 character lowercase hex string.
 * @throws std::invalid_argument if the string is not a valid digest.
 */
DigestArray hex_to_digest(const std::string &hex);

/// True if @p hex is exactly 64 characters of [0-9a-f].
bool is_valid_hex_digest(const std::string &hex);

/// Parse "sha256" / "blake3" (case-insensitive).
HashAlgorithm parse_hash_algorithm(const std::string &name);

std::string hash_algorithm_name(HashAlgorithm algo);

} // namespace dedupfs::utils

#endif // DEDUPFS_DIGEST_HPP
