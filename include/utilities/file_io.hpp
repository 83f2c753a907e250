#ifndef DEDUPFS_FILE_IO_HPP
#define DEDUPFS_FILE_IO_HPP

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace dedupfs::utils {

/// Prefix of in-flight temporary files; enumeration must skip these.
inline constexpr const char *TMP_PREFIX = ".tmp_";

/**
 * @brief Write @p data to @p target atomically.
 *
 * The bytes go to a uniquely named temporary file next to the target, which
 * is then renamed over it. On POSIX the rename is atomic within one
 * filesystem, so readers see either the old file, no file, or the complete
 * new file.
 *
 * @throws StoreWriteError if any step fails; the temporary file is removed.
 */
void atomic_write_file(const std::filesystem::path &target,
                       std::span<const std::byte> data);

/**
 * @brief Read a whole file.
 * @throws std::runtime_error if the file cannot be opened or read.
 */
std::vector<std::byte> read_file_bytes(const std::filesystem::path &path);

/// True if @p name is a temporary file left by atomic_write_file().
bool is_temp_file_name(const std::string &name);

} // namespace dedupfs::utils

#endif // DEDUPFS_FILE_IO_HPP
