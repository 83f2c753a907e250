#include "utilities/file_io.hpp"

#include "utilities/dedup_errors.hpp"

#include <cstdint>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace dedupfs::utils {

namespace {
// Unique per call so concurrent writers of the same target never share a
// temporary file.
fs::path make_tmp_path(const fs::path &dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return dir / (std::string(TMP_PREFIX) + std::to_string(dist(rng)));
}
} // namespace

void atomic_write_file(const fs::path &target,
                       std::span<const std::byte> data) {
  std::error_code ec;
  const fs::path dir = target.parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      throw StoreWriteError(dir.string(), ec.message());
    }
  }

  const fs::path tmp = make_tmp_path(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw StoreWriteError(tmp.string(), "cannot open temporary file");
    }
    ofs.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      fs::remove(tmp, ec);
      throw StoreWriteError(tmp.string(), "short write");
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw StoreWriteError(target.string(), ec.message());
  }
}

std::vector<std::byte> read_file_bytes(const fs::path &path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    throw std::runtime_error("Cannot open " + path.string());
  }
  const std::streamsize size = in.tellg();
  if (size < 0) {
    throw std::runtime_error("Cannot determine size of " + path.string());
  }
  std::vector<std::byte> bytes(static_cast<std::size_t>(size));
  in.seekg(0, std::ios::beg);
  if (size > 0 && !in.read(reinterpret_cast<char *>(bytes.data()), size)) {
    throw std::runtime_error("Short read from " + path.string());
  }
  return bytes;
}

bool is_temp_file_name(const std::string &name) {
  return name.rfind(TMP_PREFIX, 0) == 0;
}

} // namespace dedupfs::utils
