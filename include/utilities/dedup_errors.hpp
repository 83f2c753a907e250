#ifndef DEDUPFS_DEDUP_ERRORS_HPP
#define DEDUPFS_DEDUP_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dedupfs {

/**
 * @brief Base class for failures raised by the chunking and storage core.
 *
 * None of these are process-fatal: chunks and recipes stored before the
 * failure stay valid.
 */
class DedupError : public std::runtime_error {
public:
  explicit DedupError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief A recipe references a digest that is absent from the chunk store.
 *
 * Raised by restore; never retried internally.
 */
class MissingChunkError : public DedupError {
public:
  /// Position used when the lookup was not made on behalf of a recipe.
  static constexpr std::size_t kNoPosition = static_cast<std::size_t>(-1);

  MissingChunkError(std::string digest, std::size_t position = kNoPosition);

  const std::string &digest() const { return digest_; }
  /// Zero-based index of the reference inside the recipe, or kNoPosition.
  std::size_t position() const { return position_; }
  bool hasPosition() const { return position_ != kNoPosition; }

private:
  std::string digest_;
  std::size_t position_;
};

/**
 * @brief Retrieved bytes do not match the lengths recorded in a recipe.
 */
class CorruptRecipeError : public DedupError {
public:
  CorruptRecipeError(uint64_t expected, uint64_t actual,
                     const std::string &detail = "");

  uint64_t expected() const { return expected_; }
  uint64_t actual() const { return actual_; }

private:
  uint64_t expected_;
  uint64_t actual_;
};

/**
 * @brief The durable medium rejected a chunk or recipe write.
 */
class StoreWriteError : public DedupError {
public:
  StoreWriteError(std::string path, const std::string &reason);

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/**
 * @brief A stored chunk exists but cannot be decoded or fails its digest.
 */
class CorruptChunkError : public DedupError {
public:
  CorruptChunkError(std::string digest, const std::string &reason);

  const std::string &digest() const { return digest_; }

private:
  std::string digest_;
};

/// Persisted recipe text could not be parsed.
class RecipeFormatError : public DedupError {
public:
  explicit RecipeFormatError(const std::string &reason)
      : DedupError("Malformed recipe: " + reason) {}
};

/// No recipe is registered under the requested name.
class FileNotFoundError : public DedupError {
public:
  explicit FileNotFoundError(std::string name);

  const std::string &name() const { return name_; }

private:
  std::string name_;
};

} // namespace dedupfs

#endif // DEDUPFS_DEDUP_ERRORS_HPP
