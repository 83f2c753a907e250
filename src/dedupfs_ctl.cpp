#include "utilities/chunk_store.hpp"
#include "utilities/config.hpp"
#include "utilities/dedup_errors.hpp"
#include "utilities/file_io.hpp"
#include "utilities/file_manager.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void usage() {
  std::cout << "Usage: dedupfs_ctl write <path> [name]\n"
            << "       dedupfs_ctl read <name> [out_path]\n"
            << "       dedupfs_ctl ls\n"
            << "       dedupfs_ctl rm <name>\n"
            << "       dedupfs_ctl stats\n";
}

static int write_command(dedupfs::FileManager &manager, const fs::path &path,
                         const std::string &name) {
  std::vector<std::byte> data = dedupfs::utils::read_file_bytes(path);
  auto report = manager.writeFile(name, data);
  std::cout << "Saved '" << name << "' (" << data.size() << " bytes, "
            << report.recipe.chunks.size() << " chunks, " << report.new_chunks
            << " new, " << report.dedup_chunks << " deduplicated)"
            << std::endl;
  return 0;
}

static int read_command(dedupfs::FileManager &manager, const std::string &name,
                        const std::string &outPath) {
  std::vector<std::byte> data = manager.readFile(name);
  if (outPath.empty()) {
    std::cout.write(reinterpret_cast<const char *>(data.data()),
                    static_cast<std::streamsize>(data.size()));
    std::cout.flush();
    return std::cout ? 0 : 1;
  }
  dedupfs::utils::atomic_write_file(outPath, data);
  return 0;
}

static int list_command(dedupfs::FileManager &manager) {
  auto names = manager.listFiles();
  if (names.empty()) {
    std::cout << "No files found in storage." << std::endl;
    return 0;
  }
  for (const auto &name : names) {
    auto size = manager.fileSize(name);
    std::cout << std::setw(12) << (size ? std::to_string(*size) : "?") << "  "
              << name << std::endl;
  }
  return 0;
}

static int stats_command(dedupfs::FileManager &manager) {
  dedupfs::StoreStats stats = manager.store().stats();
  uint64_t referenced = 0;
  for (const auto &name : manager.listFiles()) {
    referenced += manager.fileSize(name).value_or(0);
  }
  std::cout << "backend        " << manager.store().backendId() << '\n'
            << "chunks         " << stats.chunk_count << '\n'
            << "logical_bytes  " << stats.logical_bytes << '\n'
            << "stored_bytes   " << stats.stored_bytes << '\n'
            << "file_bytes     " << referenced << '\n';
  if (referenced > 0) {
    const double savings =
        100.0 * (1.0 - static_cast<double>(stats.logical_bytes) /
                           static_cast<double>(referenced));
    std::cout << "dedup_savings  " << std::fixed << std::setprecision(1)
              << savings << "%\n";
  }
  std::cout << MetricsRegistry::instance().toPrometheus();
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];

  try {
    dedupfs::RuntimeOptions opts = dedupfs::loadRuntimeOptions();
    if (!opts.dataDir.empty()) {
      dedupfs::setVarDir(opts.dataDir);
    }
    Logger::init(dedupfs::logsDir() + "/dedupfs.log", opts.logLevel);

    auto store = std::make_shared<dedupfs::FileChunkStore>(
        dedupfs::casRoot(), opts.compressionLevel, opts.hashAlgorithm);
    auto catalog =
        std::make_shared<dedupfs::RecipeCatalog>(dedupfs::recipesDir());
    dedupfs::FileManager manager(store, opts.chunker, catalog);

    if (cmd == "write" && (argc == 3 || argc == 4)) {
      fs::path path = argv[2];
      std::string name = argc == 4 ? argv[3] : path.filename().string();
      return write_command(manager, path, name);
    } else if (cmd == "read" && (argc == 3 || argc == 4)) {
      return read_command(manager, argv[2], argc == 4 ? argv[3] : "");
    } else if (cmd == "ls" && argc == 2) {
      return list_command(manager);
    } else if (cmd == "rm" && argc == 3) {
      if (!manager.deleteFile(argv[2])) {
        std::cerr << "No such file: " << argv[2] << std::endl;
        return 1;
      }
      return 0;
    } else if (cmd == "stats" && argc == 2) {
      return stats_command(manager);
    }
    usage();
    return 1;
  } catch (const dedupfs::DedupError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
