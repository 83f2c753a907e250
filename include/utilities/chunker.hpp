#ifndef DEDUPFS_CHUNKER_HPP
#define DEDUPFS_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dedupfs {

/**
 * @brief Parameters of the polynomial rolling-hash chunker.
 *
 * The defaults reproduce the reference boundary rule: a cut after the
 * current byte when (H & 0xFFF) == 0 and the chunk holds at least 48 bytes,
 * where H = (H * 256 + b) mod 1'000'000'007 restarts at 0 for each chunk.
 */
struct ChunkerOptions {
  std::size_t min_chunk_size = 48;
  uint64_t boundary_mask = 0xFFF;
  uint64_t base = 256;
  uint64_t modulus = 1'000'000'007ULL;
  /// Force a cut at this length; 0 disables the limit.
  std::size_t max_chunk_size = 0;
};

/**
 * @brief Content-defined chunker.
 *
 * Stateless between calls: every call starts from an empty chunk with
 * H = 0, so identical input always yields identical boundaries.
 */
class Chunker {
public:
  explicit Chunker(ChunkerOptions options = {});

  /**
   * @brief Length of the first chunk of @p data.
   *
   * Returns data.size() when no cut point is found (the trailing chunk is
   * flushed as is) and 0 only for empty input.
   */
  std::size_t findCutPoint(std::span<const std::byte> data) const;

  /// End offsets (exclusive) of every chunk, in order.
  std::vector<std::size_t> boundaries(std::span<const std::byte> data) const;

  /// Views into @p data, one per chunk. Empty input yields no chunks.
  std::vector<std::span<const std::byte>>
  split(std::span<const std::byte> data) const;

  /// Owned copies of every chunk; concatenation equals @p data.
  std::vector<std::vector<std::byte>>
  chunk(std::span<const std::byte> data) const;

  const ChunkerOptions &options() const { return options_; }

private:
  ChunkerOptions options_;
};

} // namespace dedupfs

#endif // DEDUPFS_CHUNKER_HPP
