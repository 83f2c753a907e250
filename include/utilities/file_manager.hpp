#ifndef DEDUPFS_FILE_MANAGER_HPP
#define DEDUPFS_FILE_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "utilities/chunk_store.hpp"
#include "utilities/chunker.hpp"
#include "utilities/recipe.hpp"

namespace dedupfs {

/// Result of ingest with per-call dedup accounting.
struct IngestReport {
  Recipe recipe;
  std::size_t new_chunks{0};    ///< References whose chunk was written now
  std::size_t dedup_chunks{0};  ///< References already present in the store
  std::size_t unique_chunks{0}; ///< Distinct digests within this input
};

/**
 * @brief Turns whole byte buffers into recipes and back.
 *
 * The chunk store is shared and passed in explicitly; the file manager
 * itself holds no mutable state beyond the optional recipe catalog, so
 * ingest() and restore() may run concurrently from many threads.
 */
class FileManager {
public:
  /**
   * @param store Chunk store shared with other callers.
   * @param chunkerOptions Boundary parameters; the defaults give the
   *        reference chunking.
   * @param catalog Optional named-recipe registry for the write/read layer.
   */
  explicit FileManager(std::shared_ptr<ChunkStore> store,
                       ChunkerOptions chunkerOptions = {},
                       std::shared_ptr<RecipeCatalog> catalog = nullptr);

  /**
   * @brief Chunk @p data, store every chunk and return the recipe.
   * @throws StoreWriteError if the store rejects a write; no recipe is
   *         produced in that case.
   */
  Recipe ingest(std::span<const std::byte> data);

  /// ingest() plus dedup accounting for this call.
  IngestReport ingestWithReport(std::span<const std::byte> data);

  /**
   * @brief Reassemble the bytes described by @p recipe.
   * @throws MissingChunkError naming the digest and its position.
   * @throws CorruptRecipeError if lengths disagree with the retrieved data.
   * @throws CorruptChunkError if a stored chunk fails verification.
   */
  std::vector<std::byte> restore(const Recipe &recipe) const;

  /// Dedup reporting: is this digest present in the store?
  bool containsChunk(const std::string &digest) const;

  // Named-file layer over the recipe catalog. Each call throws
  // std::logic_error if the manager was built without a catalog.

  /// Ingest and register under @p name, replacing any previous recipe.
  IngestReport writeFile(const std::string &name,
                         std::span<const std::byte> data);
  /// @throws FileNotFoundError for unknown names.
  std::vector<std::byte> readFile(const std::string &name) const;
  /// Drop the recipe only; chunks stay in the store.
  bool deleteFile(const std::string &name);
  std::vector<std::string> listFiles() const;
  /// Recorded size of a registered file, std::nullopt if unknown.
  std::optional<uint64_t> fileSize(const std::string &name) const;

  ChunkStore &store() const { return *store_; }
  const Chunker &chunker() const { return chunker_; }

private:
  RecipeCatalog &requireCatalog() const;

  std::shared_ptr<ChunkStore> store_;
  Chunker chunker_;
  std::shared_ptr<RecipeCatalog> catalog_;
};

} // namespace dedupfs

#endif // DEDUPFS_FILE_MANAGER_HPP
