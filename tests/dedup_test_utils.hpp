#ifndef DEDUPFS_DEDUP_TEST_UTILS_HPP
#define DEDUPFS_DEDUP_TEST_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <random>
#include <string>
#include <vector>

#include "utilities/chunker.hpp"
#include "utilities/var_dir.hpp"

/// Deterministic pseudo-random bytes (std::mt19937 output is portable).
inline std::vector<std::byte> randomBytes(std::size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::vector<std::byte> out(size);
  for (auto &b : out) {
    b = static_cast<std::byte>(rng() & 0xFF);
  }
  return out;
}

inline std::vector<std::byte> toBytes(const std::string &text) {
  std::vector<std::byte> out(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    out[i] = static_cast<std::byte>(text[i]);
  }
  return out;
}

inline std::vector<std::byte> concat(std::initializer_list<std::vector<std::byte>> parts) {
  std::vector<std::byte> out;
  for (const auto &p : parts) {
    out.insert(out.end(), p.begin(), p.end());
  }
  return out;
}

/**
 * @brief Random block whose last byte is a real content-defined cut.
 *
 * The block is truncated to its last cut point before the trailing flush,
 * so chunking it in the middle of a larger buffer (starting on a boundary)
 * yields exactly the chunks it yields alone. Seeds are advanced until a
 * block with at least one cut is found.
 */
inline std::vector<std::byte> alignedRandomBlock(std::size_t approxSize,
                                                 uint32_t seed) {
  dedupfs::Chunker chunker;
  for (uint32_t s = seed;; ++s) {
    auto block = randomBytes(approxSize, s);
    auto ends = chunker.boundaries(block);
    if (ends.size() >= 2) {
      block.resize(ends[ends.size() - 2]);
      return block;
    }
  }
}

/// Fresh directory under the test var dir, removed on destruction.
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::string &name)
      : path_(std::filesystem::path(dedupfs::getVarDir()) / "tmp" / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

#endif // DEDUPFS_DEDUP_TEST_UTILS_HPP
