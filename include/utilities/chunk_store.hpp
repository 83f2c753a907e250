#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "utilities/digest.hpp"

namespace dedupfs {

/// Snapshot of store contents and per-instance activity.
struct StoreStats {
  std::size_t chunk_count{0};
  uint64_t stored_bytes{0};  ///< Bytes occupied by stored entries
  uint64_t logical_bytes{0}; ///< Sum of the original chunk lengths
  uint64_t puts{0};          ///< put() calls since construction
  uint64_t dedup_hits{0};    ///< put() calls that found the digest present
};

/**
 * @brief Content-addressed chunk storage.
 *
 * The key of every entry is the hex digest of its bytes, so put() is
 * idempotent and entries are never rewritten. Implementations must be safe
 * for concurrent calls.
 */
class ChunkStore {
public:
  struct PutResult {
    std::string digest;
    bool inserted{false}; ///< False when the chunk was already present
  };

  explicit ChunkStore(utils::HashAlgorithm algo) : hash_algo_(algo) {}
  virtual ~ChunkStore() = default;

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * @brief Store a chunk and return its hex digest.
   * @throws StoreWriteError if the medium rejects the write.
   */
  std::string put(std::span<const std::byte> data) {
    return store(data).digest;
  }

  /**
   * @brief Store a chunk, reporting whether it was new.
   */
  virtual PutResult store(std::span<const std::byte> data) = 0;

  /**
   * @brief Retrieve a chunk by digest.
   * @throws MissingChunkError if no entry exists.
   * @throws CorruptChunkError if the entry cannot be decoded or verified.
   */
  virtual std::vector<std::byte> get(const std::string &digest) const = 0;

  /// Existence check without loading the chunk.
  virtual bool contains(const std::string &digest) const = 0;

  /// Number of stored chunks.
  virtual std::size_t size() const = 0;

  /// All stored digests, sorted.
  virtual std::vector<std::string> listChunks() const = 0;

  virtual StoreStats stats() const = 0;

  /// Human-readable backend identifier for diagnostics.
  virtual std::string backendId() const = 0;

  utils::HashAlgorithm hashAlgorithm() const { return hash_algo_; }

  /// Hex digest of @p data under this store's algorithm.
  std::string digestOf(std::span<const std::byte> data) const;

protected:
  void recordPut(std::size_t length, bool inserted);

  utils::HashAlgorithm hash_algo_;
  std::atomic<uint64_t> puts_{0};
  std::atomic<uint64_t> dedup_hits_{0};
};

/**
 * @brief Volatile store backed by in-process maps.
 *
 * Entries are spread over shards chosen from the digest. Each shard has its
 * own reader/writer lock, so operations on different shards never wait on
 * each other and readers of one shard share its lock.
 */
class MemoryChunkStore : public ChunkStore {
public:
  explicit MemoryChunkStore(
      utils::HashAlgorithm algo = utils::HashAlgorithm::SHA256);

  PutResult store(std::span<const std::byte> data) override;
  std::vector<std::byte> get(const std::string &digest) const override;
  bool contains(const std::string &digest) const override;
  std::size_t size() const override;
  std::vector<std::string> listChunks() const override;
  StoreStats stats() const override;
  std::string backendId() const override { return "memory"; }

  /**
   * @brief Drop an entry; only used to simulate data loss in tests and
   * tooling. Returns true if the entry existed.
   */
  bool erase(const std::string &digest);

private:
  static constexpr std::size_t kShards = 64;

  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::vector<std::byte>> chunks;
  };

  Shard &shardFor(const std::string &digest);
  const Shard &shardFor(const std::string &digest) const;

  std::array<Shard, kShards> shards_;
};

/**
 * @brief Durable store laid out as a sharded file tree.
 *
 * Chunks are stored zstd-compressed under
 *   <root>/cas/<hex[0:2]>/<hex[2:]>
 * Each write goes to a temporary file in the shard directory and is
 * published with rename(), so readers never observe a partial chunk.
 * Hashing and compression run before any lock is taken. A lock stripe
 * chosen from the digest is held only for the existence check and the
 * publish, so concurrent puts of one digest insert it exactly once.
 */
class FileChunkStore : public ChunkStore {
public:
  explicit FileChunkStore(
      std::filesystem::path root, int compression_level = 3,
      utils::HashAlgorithm algo = utils::HashAlgorithm::SHA256);

  PutResult store(std::span<const std::byte> data) override;
  std::vector<std::byte> get(const std::string &digest) const override;
  bool contains(const std::string &digest) const override;
  std::size_t size() const override;
  std::vector<std::string> listChunks() const override;
  StoreStats stats() const override;
  std::string backendId() const override { return "local_fs"; }

  /// On-disk location of a chunk (which may not exist).
  std::filesystem::path chunkPath(const std::string &digest) const;

  const std::filesystem::path &root() const { return root_; }

private:
  static constexpr std::size_t kLockStripes = 64;

  std::mutex &stripeFor(const std::string &digest) const;

  std::filesystem::path root_;
  std::filesystem::path cas_dir_;
  int compression_level_;
  mutable std::array<std::mutex, kLockStripes> stripes_;
};

} // namespace dedupfs

#endif // CHUNK_STORE_HPP
