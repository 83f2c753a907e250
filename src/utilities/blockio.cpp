#include "utilities/blockio.hpp"

#include <stdexcept> // For std::runtime_error
#include <zstd.h>    // For zstd compression

using dedupfs::utils::DigestArray;
using dedupfs::utils::HashAlgorithm;

// Constructor
BlockIO::BlockIO(int compression_level, HashAlgorithm hash_algo)
    : compression_level_(compression_level), hash_algo_(hash_algo) {
  if (sodium_init() < 0) {
    // sodium_init() returns -1 on error, 0 on success, 1 if already
    // initialized.
    throw std::runtime_error("Failed to initialize libsodium");
  }

  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

// Destructor
BlockIO::~BlockIO() = default;

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    buffer_.insert(buffer_.end(), data, data + size);
    if (hash_algo_ == HashAlgorithm::SHA256) {
      crypto_hash_sha256_update(
          &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
    } else {
      blake3_hasher_update(&blake3_state_,
                           reinterpret_cast<const uint8_t *>(data), size);
    }
  }
}

std::vector<std::byte> BlockIO::finalize_raw() const { return buffer_; }

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, result.digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, result.digest.data(),
                           dedupfs::utils::DIGEST_SIZE);
  }
  result.hex = dedupfs::utils::digest_to_hex(result.digest);
  result.raw = std::move(buffer_);
  buffer_.clear();

  finalized_ = true;
  return result;
}

DigestArray BlockIO::hash(std::span<const std::byte> data,
                          HashAlgorithm algo) {
  DigestArray digest{};
  const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
  if (algo == HashAlgorithm::SHA256) {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    crypto_hash_sha256(digest.data(), bytes, data.size());
  } else {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, bytes, data.size());
    blake3_hasher_finalize(&hasher, digest.data(),
                           dedupfs::utils::DIGEST_SIZE);
  }
  return digest;
}

// Compression methods
std::vector<std::byte>
BlockIO::compress_data(std::span<const std::byte> plaintext) {
  size_t const cBuffSize = ZSTD_compressBound(plaintext.size());
  std::vector<std::byte> compressed_data(cBuffSize);

  // An empty input still yields a valid (empty-content) frame so that
  // zero-length chunks round-trip through the store.
  size_t const cSize =
      ZSTD_compress(compressed_data.data(), cBuffSize, plaintext.data(),
                    plaintext.size(), compression_level_);

  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(cSize));
  }

  compressed_data.resize(cSize);
  return compressed_data;
}

std::vector<std::byte>
BlockIO::decompress_data(std::span<const std::byte> compressed,
                         size_t original_size) {
  if (compressed.empty()) {
    throw std::runtime_error("ZSTD_decompress failed: empty input frame");
  }

  unsigned long long const frameSize =
      ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
    throw std::runtime_error("ZSTD_decompress failed: not a zstd frame");
  }
  if (original_size == 0) {
    if (frameSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throw std::runtime_error(
          "ZSTD_decompress failed: original_size must be provided or "
          "retrievable from frame, and it was not.");
    }
    original_size = static_cast<size_t>(frameSize);
  } else if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN &&
             frameSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: frame size does not match original size.");
  }

  if (original_size == 0) {
    return {};
  }

  std::vector<std::byte> decompressed_data(original_size);

  size_t const dSize =
      ZSTD_decompress(decompressed_data.data(), original_size,
                      compressed.data(), compressed.size());

  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }

  if (dSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }

  return decompressed_data;
}
