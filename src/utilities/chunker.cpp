#include "utilities/chunker.hpp"

#include <stdexcept>

namespace dedupfs {

Chunker::Chunker(ChunkerOptions options) : options_(options) {
  if (options_.modulus == 0) {
    throw std::invalid_argument("Chunker modulus must be non-zero");
  }
  if (options_.max_chunk_size != 0 &&
      options_.max_chunk_size < options_.min_chunk_size) {
    throw std::invalid_argument(
        "Chunker max_chunk_size must be 0 or >= min_chunk_size");
  }
}

std::size_t Chunker::findCutPoint(std::span<const std::byte> data) const {
  uint64_t hash = 0;
  for (std::size_t i = 0; i < data.size(); ++i) {
    hash = (hash * options_.base + std::to_integer<uint64_t>(data[i])) %
           options_.modulus;
    const std::size_t length = i + 1;
    if (length < options_.min_chunk_size)
      continue;
    if ((hash & options_.boundary_mask) == 0)
      return length;
    if (options_.max_chunk_size != 0 && length >= options_.max_chunk_size)
      return length;
  }
  return data.size();
}

std::vector<std::size_t>
Chunker::boundaries(std::span<const std::byte> data) const {
  std::vector<std::size_t> ends;
  std::size_t offset = 0;
  while (offset < data.size()) {
    offset += findCutPoint(data.subspan(offset));
    ends.push_back(offset);
  }
  return ends;
}

std::vector<std::span<const std::byte>>
Chunker::split(std::span<const std::byte> data) const {
  std::vector<std::span<const std::byte>> pieces;
  std::size_t start = 0;
  for (std::size_t end : boundaries(data)) {
    pieces.push_back(data.subspan(start, end - start));
    start = end;
  }
  return pieces;
}

std::vector<std::vector<std::byte>>
Chunker::chunk(std::span<const std::byte> data) const {
  std::vector<std::vector<std::byte>> chunks;
  for (auto piece : split(data)) {
    chunks.emplace_back(piece.begin(), piece.end());
  }
  return chunks;
}

} // namespace dedupfs
