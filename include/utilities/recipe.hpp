#ifndef DEDUPFS_RECIPE_HPP
#define DEDUPFS_RECIPE_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dedupfs {

/// One reference inside a recipe.
struct ChunkRef {
  std::string digest; ///< Lowercase hex digest of the chunk bytes
  uint64_t length{0}; ///< Chunk length in bytes

  bool operator==(const ChunkRef &other) const = default;
};

/**
 * @brief Ordered chunk references that reconstruct one file.
 *
 * Invariant: the reference lengths sum to total_size.
 */
struct Recipe {
  std::vector<ChunkRef> chunks;
  uint64_t total_size{0};

  /// Sum of the recorded reference lengths.
  uint64_t referencedBytes() const;
  bool isConsistent() const { return referencedBytes() == total_size; }
  /// Digests in recipe order.
  std::vector<std::string> digests() const;

  bool operator==(const Recipe &other) const = default;
};

/// First line of every persisted recipe.
inline constexpr const char *RECIPE_HEADER = "dedupfs-recipe v1";

/**
 * @brief Render a recipe in the persisted text form:
 *
 *   dedupfs-recipe v1
 *   total_size <n>
 *   chunks <count>
 *   <hex digest> <length>     (one line per reference)
 */
std::string serializeRecipe(const Recipe &recipe);

/**
 * @brief Parse the text form produced by serializeRecipe().
 * @throws RecipeFormatError on any malformed or inconsistent input.
 */
Recipe parseRecipe(const std::string &text);

/**
 * @brief Named recipes persisted as files under one directory.
 *
 * Names are percent-encoded into file names, so any string (including ones
 * with '/') maps to a single flat file. A name whose encoding would exceed
 * the 255-byte file name limit is stored as "~<sha256 of name>.recipe",
 * with the encoded name on a "name" line ahead of the recipe text. Writes
 * use temp-then-rename.
 */
class RecipeCatalog {
public:
  explicit RecipeCatalog(std::filesystem::path dir);

  /// Store or replace the recipe registered under @p name.
  void save(const std::string &name, const Recipe &recipe);

  /**
   * @brief Load a recipe.
   * @throws FileNotFoundError if no recipe is registered under @p name.
   * @throws RecipeFormatError if the stored recipe cannot be parsed.
   */
  Recipe load(const std::string &name) const;

  /// Like load(), but returns std::nullopt for unknown names.
  std::optional<Recipe> tryLoad(const std::string &name) const;

  bool exists(const std::string &name) const;

  /// Remove a recipe; chunks are untouched. Returns false if absent.
  bool remove(const std::string &name);

  /// Registered names, sorted.
  std::vector<std::string> list() const;

  const std::filesystem::path &directory() const { return dir_; }

  static std::string encodeName(const std::string &name);
  /**
   * @brief Inverse of encodeName() for percent-encoded entries.
   * @throws std::invalid_argument for strings encodeName() cannot produce
   * and for digest-keyed entries, whose name is only stored in the file.
   */
  static std::string decodeName(const std::string &fileName);

private:
  std::filesystem::path pathFor(const std::string &name) const;

  std::filesystem::path dir_;
  // Serialises replace/remove of the same name within this process.
  mutable std::mutex mutex_;
};

} // namespace dedupfs

#endif // DEDUPFS_RECIPE_HPP
