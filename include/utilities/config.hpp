#ifndef DEDUPFS_CONFIG_HPP
#define DEDUPFS_CONFIG_HPP

#include <string>

#include "utilities/chunker.hpp"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

namespace dedupfs {

/// Tunables shared by the command-line tool and embedders.
struct RuntimeOptions {
  int compressionLevel = 3;
  utils::HashAlgorithm hashAlgorithm = utils::HashAlgorithm::SHA256;
  ChunkerOptions chunker;
  LogLevel logLevel = LogLevel::INFO;
  /// Overrides the var directory when non-empty.
  std::string dataDir;
};

/**
 * @brief Apply the keys of a YAML document on top of @p opts.
 *
 * Recognised keys: compression_level, hash_algorithm, min_chunk_size,
 * max_chunk_size, log_level, data_dir. Unknown keys are ignored.
 *
 * @throws YAML::Exception on malformed YAML or mistyped values.
 * @throws std::invalid_argument on unknown algorithm or level names.
 */
void applyYamlConfig(RuntimeOptions &opts, const std::string &yamlText);

/**
 * @brief Build the effective options.
 *
 * Reads the file named by DEDUPFS_CONFIG (default dedupfs_config.yaml) and
 * then applies DEDUPFS_COMPRESSION_LEVEL, DEDUPFS_HASH_ALGO,
 * DEDUPFS_MIN_CHUNK, DEDUPFS_MAX_CHUNK and DEDUPFS_LOG_LEVEL. A missing file
 * keeps the defaults; an unreadable one is logged and ignored.
 */
RuntimeOptions loadRuntimeOptions();

} // namespace dedupfs

#endif // DEDUPFS_CONFIG_HPP
