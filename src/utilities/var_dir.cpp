#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace dedupfs {

static std::string varDir = [] {
  const char *env = std::getenv("DEDUPFS_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/dedupfs"))
    return std::string("/var/dedupfs");
  return std::string("var/dedupfs");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string casRoot() { return getVarDir() + "/store"; }

std::string recipesDir() { return casRoot() + "/recipes"; }

} // namespace dedupfs
