#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "dedupfs_test_var";
  dedupfs::setVarDir(base.string());
  fs::create_directories(dedupfs::logsDir());

  // Initialize the logger for tests
  try {
    Logger::init(dedupfs::logsDir() + "/dedupfs_tests.log", LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
