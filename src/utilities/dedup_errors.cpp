#include "utilities/dedup_errors.hpp"

#include <utility>

namespace dedupfs {

MissingChunkError::MissingChunkError(std::string digest, std::size_t position)
    : DedupError(position == kNoPosition
                     ? "Missing chunk " + digest
                     : "Missing chunk " + digest + " at recipe position " +
                           std::to_string(position)),
      digest_(std::move(digest)), position_(position) {}

CorruptRecipeError::CorruptRecipeError(uint64_t expected, uint64_t actual,
                                       const std::string &detail)
    : DedupError("Corrupt recipe: expected " + std::to_string(expected) +
                 " bytes, got " + std::to_string(actual) +
                 (detail.empty() ? "" : " (" + detail + ")")),
      expected_(expected), actual_(actual) {}

StoreWriteError::StoreWriteError(std::string path, const std::string &reason)
    : DedupError("Store write failed for " + path + ": " + reason),
      path_(std::move(path)) {}

CorruptChunkError::CorruptChunkError(std::string digest,
                                     const std::string &reason)
    : DedupError("Corrupt chunk " + digest + ": " + reason),
      digest_(std::move(digest)) {}

FileNotFoundError::FileNotFoundError(std::string name)
    : DedupError("No such file: " + name), name_(std::move(name)) {}

} // namespace dedupfs
