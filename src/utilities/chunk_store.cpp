#include "utilities/chunk_store.hpp"

#include "utilities/blockio.hpp"
#include "utilities/dedup_errors.hpp"
#include "utilities/file_io.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <fstream>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>
#include <zstd.h>

namespace fs = std::filesystem;

namespace dedupfs {

namespace {
// Upper bound of a zstd frame header; enough to read the content size.
constexpr std::size_t kZstdFrameHeaderMax = 18;
} // namespace

// ---------------------------------------------------------------------------
// ChunkStore
// ---------------------------------------------------------------------------

std::string ChunkStore::digestOf(std::span<const std::byte> data) const {
  return utils::digest_to_hex(BlockIO::hash(data, hash_algo_));
}

void ChunkStore::recordPut(std::size_t length, bool inserted) {
  puts_.fetch_add(1, std::memory_order_relaxed);
  auto &metrics = MetricsRegistry::instance();
  if (inserted) {
    metrics.incrementCounter("dedupfs_chunks_written_total", 1,
                             {{"backend", backendId()}});
    metrics.observe("dedupfs_chunk_size_bytes", static_cast<double>(length));
  } else {
    dedup_hits_.fetch_add(1, std::memory_order_relaxed);
    metrics.incrementCounter("dedupfs_chunks_deduplicated_total", 1,
                             {{"backend", backendId()}});
  }
}

// ---------------------------------------------------------------------------
// MemoryChunkStore
// ---------------------------------------------------------------------------

MemoryChunkStore::MemoryChunkStore(utils::HashAlgorithm algo)
    : ChunkStore(algo) {}

MemoryChunkStore::Shard &MemoryChunkStore::shardFor(const std::string &digest) {
  return shards_[std::hash<std::string>{}(digest) % kShards];
}

const MemoryChunkStore::Shard &
MemoryChunkStore::shardFor(const std::string &digest) const {
  return shards_[std::hash<std::string>{}(digest) % kShards];
}

ChunkStore::PutResult
MemoryChunkStore::store(std::span<const std::byte> data) {
  BlockIO block(BlockIO::DEFAULT_COMPRESSION_LEVEL, hash_algo_);
  block.ingest(data);
  DigestResult hashed = block.finalize_hashed();

  PutResult result;
  result.digest = hashed.hex;
  Shard &shard = shardFor(result.digest);
  {
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto [it, inserted] = shard.chunks.try_emplace(result.digest);
    if (inserted) {
      it->second = std::move(hashed.raw);
    }
    result.inserted = inserted;
  }
  recordPut(data.size(), result.inserted);
  return result;
}

std::vector<std::byte> MemoryChunkStore::get(const std::string &digest) const {
  const Shard &shard = shardFor(digest);
  std::shared_lock<std::shared_mutex> lock(shard.mutex);
  auto it = shard.chunks.find(digest);
  if (it == shard.chunks.end()) {
    throw MissingChunkError(digest);
  }
  return it->second;
}

bool MemoryChunkStore::contains(const std::string &digest) const {
  const Shard &shard = shardFor(digest);
  std::shared_lock<std::shared_mutex> lock(shard.mutex);
  return shard.chunks.count(digest) > 0;
}

std::size_t MemoryChunkStore::size() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    total += shard.chunks.size();
  }
  return total;
}

std::vector<std::string> MemoryChunkStore::listChunks() const {
  std::vector<std::string> digests;
  for (const auto &shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    for (const auto &kv : shard.chunks) {
      digests.push_back(kv.first);
    }
  }
  std::sort(digests.begin(), digests.end());
  return digests;
}

StoreStats MemoryChunkStore::stats() const {
  StoreStats stats;
  for (const auto &shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    stats.chunk_count += shard.chunks.size();
    for (const auto &kv : shard.chunks) {
      stats.logical_bytes += kv.second.size();
    }
  }
  stats.stored_bytes = stats.logical_bytes;
  stats.puts = puts_.load();
  stats.dedup_hits = dedup_hits_.load();
  return stats;
}

bool MemoryChunkStore::erase(const std::string &digest) {
  Shard &shard = shardFor(digest);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  return shard.chunks.erase(digest) > 0;
}

// ---------------------------------------------------------------------------
// FileChunkStore
// ---------------------------------------------------------------------------

FileChunkStore::FileChunkStore(fs::path root, int compression_level,
                               utils::HashAlgorithm algo)
    : ChunkStore(algo), root_(std::move(root)), cas_dir_(root_ / "cas"),
      compression_level_(compression_level) {
  std::error_code ec;
  fs::create_directories(cas_dir_, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Cannot create chunk store directory " +
                                  cas_dir_.string() + ": " + ec.message());
    throw StoreWriteError(cas_dir_.string(), ec.message());
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Chunk store opened at " + root_.string() + " (" +
                                utils::hash_algorithm_name(algo) + ")");
}

fs::path FileChunkStore::chunkPath(const std::string &digest) const {
  return cas_dir_ / digest.substr(0, 2) / digest.substr(2);
}

std::mutex &FileChunkStore::stripeFor(const std::string &digest) const {
  return stripes_[std::hash<std::string>{}(digest) % kLockStripes];
}

ChunkStore::PutResult FileChunkStore::store(std::span<const std::byte> data) {
  BlockIO codec(compression_level_, hash_algo_);
  codec.ingest(data);
  DigestResult hashed = codec.finalize_hashed();

  PutResult result;
  result.digest = hashed.hex;
  const fs::path target = chunkPath(result.digest);

  std::error_code ec;
  if (fs::exists(target, ec)) {
    Logger::trace("Deduplicated chunk %s", result.digest.c_str());
    recordPut(data.size(), false);
    return result;
  }

  std::vector<std::byte> compressed;
  try {
    compressed = codec.compress_data(hashed.raw);
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Compression failed for chunk " +
                                                   result.digest + ": " +
                                                   e.what());
    throw StoreWriteError(target.string(), e.what());
  }

  {
    std::lock_guard<std::mutex> lock(stripeFor(result.digest));
    if (fs::exists(target, ec)) {
      // Published by a concurrent put while this one was compressing.
      Logger::trace("Deduplicated chunk %s", result.digest.c_str());
    } else {
      try {
        utils::atomic_write_file(target, compressed);
      } catch (const StoreWriteError &e) {
        Logger::getInstance().log(LogLevel::ERROR, e.what());
        throw;
      }
      result.inserted = true;
    }
  }

  if (result.inserted) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Wrote chunk " + result.digest + " (" +
                                  std::to_string(data.size()) + " bytes, " +
                                  std::to_string(compressed.size()) +
                                  " stored)");
  }
  recordPut(data.size(), result.inserted);
  return result;
}

std::vector<std::byte> FileChunkStore::get(const std::string &digest) const {
  if (!utils::is_valid_hex_digest(digest)) {
    throw std::invalid_argument("Invalid chunk digest: '" + digest + "'");
  }
  const utils::DigestArray expected = utils::hex_to_digest(digest);
  const fs::path path = chunkPath(digest);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Chunk " + digest + " missing from store");
    throw MissingChunkError(digest);
  }

  std::vector<std::byte> compressed;
  try {
    compressed = utils::read_file_bytes(path);
  } catch (const std::runtime_error &e) {
    // The entry vanished or became unreadable between the check and the read.
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    throw MissingChunkError(digest);
  }

  std::vector<std::byte> data;
  try {
    BlockIO codec(compression_level_, hash_algo_);
    data = codec.decompress_data(compressed);
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Undecodable chunk " + digest + ": " + e.what());
    throw CorruptChunkError(digest, e.what());
  }

  if (BlockIO::hash(data, hash_algo_) != expected) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Digest mismatch for chunk " + digest);
    throw CorruptChunkError(digest, "content does not match digest");
  }
  return data;
}

bool FileChunkStore::contains(const std::string &digest) const {
  if (!utils::is_valid_hex_digest(digest))
    return false;
  std::error_code ec;
  return fs::exists(chunkPath(digest), ec);
}

std::vector<std::string> FileChunkStore::listChunks() const {
  std::vector<std::string> digests;
  std::error_code ec;
  for (const auto &shard : fs::directory_iterator(cas_dir_, ec)) {
    if (!shard.is_directory())
      continue;
    const std::string prefix = shard.path().filename().string();
    for (const auto &entry : fs::directory_iterator(shard.path(), ec)) {
      if (!entry.is_regular_file())
        continue;
      const std::string name = entry.path().filename().string();
      if (utils::is_temp_file_name(name))
        continue;
      const std::string digest = prefix + name;
      if (utils::is_valid_hex_digest(digest)) {
        digests.push_back(digest);
      }
    }
  }
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Chunk enumeration incomplete: " + ec.message());
  }
  std::sort(digests.begin(), digests.end());
  return digests;
}

std::size_t FileChunkStore::size() const { return listChunks().size(); }

StoreStats FileChunkStore::stats() const {
  StoreStats stats;
  for (const auto &digest : listChunks()) {
    const fs::path path = chunkPath(digest);
    std::error_code ec;
    const auto stored = fs::file_size(path, ec);
    if (ec)
      continue;
    ++stats.chunk_count;
    stats.stored_bytes += stored;

    // The zstd frame header records the original size.
    std::ifstream in(path, std::ios::binary);
    char header[kZstdFrameHeaderMax] = {};
    in.read(header, sizeof(header));
    const unsigned long long original =
        ZSTD_getFrameContentSize(header, static_cast<size_t>(in.gcount()));
    if (original != ZSTD_CONTENTSIZE_ERROR &&
        original != ZSTD_CONTENTSIZE_UNKNOWN) {
      stats.logical_bytes += original;
    }
  }
  stats.puts = puts_.load();
  stats.dedup_hits = dedup_hits_.load();
  MetricsRegistry::instance().setGauge(
      "dedupfs_store_chunks", static_cast<double>(stats.chunk_count),
      {{"backend", backendId()}});
  return stats;
}

} // namespace dedupfs
