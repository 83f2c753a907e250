#include "utilities/file_manager.hpp"

#include "utilities/dedup_errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <stdexcept>
#include <unordered_set>

namespace dedupfs {

FileManager::FileManager(std::shared_ptr<ChunkStore> store,
                         ChunkerOptions chunkerOptions,
                         std::shared_ptr<RecipeCatalog> catalog)
    : store_(std::move(store)), chunker_(chunkerOptions),
      catalog_(std::move(catalog)) {
  if (!store_) {
    throw std::invalid_argument("FileManager requires a chunk store");
  }
}

Recipe FileManager::ingest(std::span<const std::byte> data) {
  return ingestWithReport(data).recipe;
}

IngestReport FileManager::ingestWithReport(std::span<const std::byte> data) {
  IngestReport report;
  std::unordered_set<std::string> seen;

  // Chunking
  const auto pieces = chunker_.split(data);
  report.recipe.chunks.reserve(pieces.size());

  // Storing(chunk i); a StoreWriteError propagates before any recipe exists.
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    ChunkStore::PutResult put;
    try {
      put = store_->store(pieces[i]);
    } catch (const StoreWriteError &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Ingest aborted at chunk " + std::to_string(i) +
                                    ": " + e.what());
      throw;
    }
    if (put.inserted) {
      ++report.new_chunks;
    } else {
      ++report.dedup_chunks;
    }
    seen.insert(put.digest);
    report.recipe.chunks.push_back({std::move(put.digest), pieces[i].size()});
  }

  report.recipe.total_size = data.size();
  report.unique_chunks = seen.size();

  MetricsRegistry::instance().incrementCounter(
      "dedupfs_bytes_ingested_total", static_cast<double>(data.size()));
  Logger::getInstance().log(
      LogLevel::INFO, "Ingested " + std::to_string(data.size()) + " bytes as " +
                          std::to_string(report.recipe.chunks.size()) +
                          " chunks (" + std::to_string(report.new_chunks) +
                          " new, " + std::to_string(report.dedup_chunks) +
                          " deduplicated)");
  return report;
}

std::vector<std::byte> FileManager::restore(const Recipe &recipe) const {
  auto &metrics = MetricsRegistry::instance();
  if (!recipe.isConsistent()) {
    metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                             {{"reason", "corrupt_recipe"}});
    Logger::getInstance().log(
        LogLevel::ERROR, "Recipe lengths sum to " +
                             std::to_string(recipe.referencedBytes()) +
                             " but total_size is " +
                             std::to_string(recipe.total_size));
    throw CorruptRecipeError(recipe.total_size, recipe.referencedBytes(),
                             "reference lengths do not sum to total_size");
  }

  // Fetching(ref i)
  std::vector<std::vector<std::byte>> fetched;
  fetched.reserve(recipe.chunks.size());
  for (std::size_t i = 0; i < recipe.chunks.size(); ++i) {
    const auto &ref = recipe.chunks[i];
    try {
      fetched.push_back(store_->get(ref.digest));
    } catch (const MissingChunkError &) {
      metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                               {{"reason", "missing_chunk"}});
      Logger::getInstance().log(LogLevel::ERROR,
                                "Restore failed: chunk " + ref.digest +
                                    " missing at position " +
                                    std::to_string(i));
      throw MissingChunkError(ref.digest, i);
    } catch (const std::invalid_argument &) {
      // A malformed digest can never be present in the store.
      metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                               {{"reason", "missing_chunk"}});
      throw MissingChunkError(ref.digest, i);
    } catch (const CorruptChunkError &) {
      metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                               {{"reason", "corrupt_chunk"}});
      throw;
    }
  }

  // Verifying
  uint64_t actualTotal = 0;
  for (std::size_t i = 0; i < fetched.size(); ++i) {
    const uint64_t expected = recipe.chunks[i].length;
    const uint64_t actual = fetched[i].size();
    if (expected != actual) {
      metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                               {{"reason", "corrupt_recipe"}});
      Logger::getInstance().log(LogLevel::ERROR,
                                "Chunk " + recipe.chunks[i].digest +
                                    " at position " + std::to_string(i) +
                                    " has " + std::to_string(actual) +
                                    " bytes, recipe records " +
                                    std::to_string(expected));
      throw CorruptRecipeError(expected, actual,
                               "chunk " + std::to_string(i) + " length");
    }
    actualTotal += actual;
  }
  if (actualTotal != recipe.total_size) {
    metrics.incrementCounter("dedupfs_restore_failures_total", 1,
                             {{"reason", "corrupt_recipe"}});
    throw CorruptRecipeError(recipe.total_size, actualTotal, "total size");
  }

  std::vector<std::byte> out;
  out.reserve(static_cast<std::size_t>(recipe.total_size));
  for (const auto &chunk : fetched) {
    out.insert(out.end(), chunk.begin(), chunk.end());
  }

  metrics.incrementCounter("dedupfs_bytes_restored_total",
                           static_cast<double>(out.size()));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Restored " + std::to_string(out.size()) +
                                " bytes from " +
                                std::to_string(recipe.chunks.size()) +
                                " chunks");
  return out;
}

bool FileManager::containsChunk(const std::string &digest) const {
  return store_->contains(digest);
}

RecipeCatalog &FileManager::requireCatalog() const {
  if (!catalog_) {
    throw std::logic_error("FileManager has no recipe catalog");
  }
  return *catalog_;
}

IngestReport FileManager::writeFile(const std::string &name,
                                    std::span<const std::byte> data) {
  auto &catalog = requireCatalog();
  IngestReport report = ingestWithReport(data);
  catalog.save(name, report.recipe);
  Logger::getInstance().log(LogLevel::INFO,
                            "Saved file " + name + " (" +
                                std::to_string(data.size()) + " bytes)");
  return report;
}

std::vector<std::byte> FileManager::readFile(const std::string &name) const {
  const Recipe recipe = requireCatalog().load(name);
  return restore(recipe);
}

bool FileManager::deleteFile(const std::string &name) {
  const bool removed = requireCatalog().remove(name);
  if (removed) {
    Logger::getInstance().log(LogLevel::INFO, "Deleted file " + name);
  }
  return removed;
}

std::vector<std::string> FileManager::listFiles() const {
  return requireCatalog().list();
}

std::optional<uint64_t> FileManager::fileSize(const std::string &name) const {
  auto recipe = requireCatalog().tryLoad(name);
  if (!recipe) {
    return std::nullopt;
  }
  return recipe->total_size;
}

} // namespace dedupfs
