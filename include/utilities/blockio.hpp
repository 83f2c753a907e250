#ifndef BLOCKIO_HPP
#define BLOCKIO_HPP

#include <array>    // For std::array
#include <blake3.h> // For the BLAKE3 hasher
#include <cstddef>  // For std::byte
#include <sodium.h> // For libsodium SHA-256
#include <span>
#include <string> // For std::string
#include <vector>

#include "utilities/digest.hpp"

// Result of hashing one buffered block.
struct DigestResult {
  dedupfs::utils::DigestArray digest; // 32 bytes for SHA-256 / BLAKE3
  std::string hex;                    // Lowercase hex rendering of digest
  std::vector<std::byte> raw;
};

/**
 * @brief Buffered block processing: content hashing and zstd compression.
 *
 * One BlockIO instance hashes exactly one block: the chunk stores ingest a
 * chunk, finalize it to obtain its digest and owned bytes, then compress
 * those bytes with the same instance. Compression helpers are stateless with
 * respect to the buffered data and may be called freely.
 */
class BlockIO {
public:
  static constexpr int DEFAULT_COMPRESSION_LEVEL = 3;

  /**
   * @brief Construct a new BlockIO processor.
   * @param compression_level Zstd compression level to use.
   * @param hash_algo Digest algorithm used by finalize_hashed().
   */
  explicit BlockIO(int compression_level = DEFAULT_COMPRESSION_LEVEL,
                   dedupfs::utils::HashAlgorithm hash_algo =
                       dedupfs::utils::HashAlgorithm::SHA256);

  ~BlockIO(); ///< Destructor

  // Appends data to the internal buffer and feeds the hasher.
  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data) {
    ingest(data.data(), data.size());
  }

  // Returns a copy of the buffered plaintext data.
  std::vector<std::byte> finalize_raw() const;

  /**
   * @brief Finalize the hash and return the digest and buffered data.
   * @throw std::logic_error If called more than once.
   */
  DigestResult finalize_hashed();

  /**
   * @brief Hash a buffer in one call without keeping a copy of it.
   */
  static dedupfs::utils::DigestArray
  hash(std::span<const std::byte> data, dedupfs::utils::HashAlgorithm algo);

  // Compression methods
  std::vector<std::byte> compress_data(std::span<const std::byte> plaintext);

  /**
   * @brief Decompress a zstd frame produced by compress_data().
   * @param original_size Expected plaintext size; 0 reads it from the frame.
   * @throw std::runtime_error On zstd errors or a size mismatch.
   */
  std::vector<std::byte> decompress_data(std::span<const std::byte> compressed,
                                         size_t original_size = 0);

  int compression_level() const { return compression_level_; }
  dedupfs::utils::HashAlgorithm hash_algorithm() const { return hash_algo_; }

private:
  std::vector<std::byte> buffer_;
  crypto_hash_sha256_state sha_state_; // Libsodium SHA-256 state
  blake3_hasher blake3_state_;
  bool finalized_ = false;    // Tracks if finalize_hashed() has been called
  int compression_level_ = DEFAULT_COMPRESSION_LEVEL; ///< Zstd level
  dedupfs::utils::HashAlgorithm hash_algo_ =
      dedupfs::utils::HashAlgorithm::SHA256;
};

#endif // BLOCKIO_HPP
