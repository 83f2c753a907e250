#include "utilities/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace dedupfs {

namespace {
void applyNode(RuntimeOptions &opts, const YAML::Node &node) {
  if (node["compression_level"])
    opts.compressionLevel = node["compression_level"].as<int>();
  if (node["hash_algorithm"])
    opts.hashAlgorithm =
        utils::parse_hash_algorithm(node["hash_algorithm"].as<std::string>());
  if (node["min_chunk_size"])
    opts.chunker.min_chunk_size = node["min_chunk_size"].as<std::size_t>();
  if (node["max_chunk_size"])
    opts.chunker.max_chunk_size = node["max_chunk_size"].as<std::size_t>();
  if (node["log_level"])
    opts.logLevel = Logger::parseLevel(node["log_level"].as<std::string>());
  if (node["data_dir"])
    opts.dataDir = node["data_dir"].as<std::string>();
}

[[noreturn]] void invalidEnv(const char *name, const char *value) {
  throw std::invalid_argument(std::string("Invalid value for ") + name + ": " +
                              value);
}

std::size_t envSize(const char *name, const char *value) {
  std::size_t used = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &used);
  } catch (const std::exception &) {
    invalidEnv(name, value);
  }
  if (value[0] == '-' || value[used] != '\0')
    invalidEnv(name, value);
  return static_cast<std::size_t>(parsed);
}

int envInt(const char *name, const char *value) {
  std::size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &used);
  } catch (const std::exception &) {
    invalidEnv(name, value);
  }
  if (value[used] != '\0')
    invalidEnv(name, value);
  return parsed;
}
} // namespace

void applyYamlConfig(RuntimeOptions &opts, const std::string &yamlText) {
  YAML::Node node = YAML::Load(yamlText);
  if (node.IsNull())
    return;
  if (!node.IsMap()) {
    throw std::invalid_argument("Configuration root must be a mapping");
  }
  applyNode(opts, node);
}

RuntimeOptions loadRuntimeOptions() {
  RuntimeOptions opts;
  const char *cfg = std::getenv("DEDUPFS_CONFIG");
  if (!cfg)
    cfg = "dedupfs_config.yaml";

  if (std::filesystem::exists(cfg)) {
    try {
      std::ifstream in(cfg);
      std::stringstream buffer;
      buffer << in.rdbuf();
      applyYamlConfig(opts, buffer.str());
    } catch (const YAML::Exception &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Ignoring malformed config ") +
                                    cfg + ": " + e.what());
      opts = RuntimeOptions{};
    } catch (const std::invalid_argument &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Ignoring invalid config ") + cfg +
                                    ": " + e.what());
      opts = RuntimeOptions{};
    }
  }

  if (const char *env = std::getenv("DEDUPFS_COMPRESSION_LEVEL"))
    opts.compressionLevel = envInt("DEDUPFS_COMPRESSION_LEVEL", env);
  if (const char *env = std::getenv("DEDUPFS_HASH_ALGO"))
    opts.hashAlgorithm = utils::parse_hash_algorithm(env);
  if (const char *env = std::getenv("DEDUPFS_MIN_CHUNK"))
    opts.chunker.min_chunk_size = envSize("DEDUPFS_MIN_CHUNK", env);
  if (const char *env = std::getenv("DEDUPFS_MAX_CHUNK"))
    opts.chunker.max_chunk_size = envSize("DEDUPFS_MAX_CHUNK", env);
  if (const char *env = std::getenv("DEDUPFS_LOG_LEVEL"))
    opts.logLevel = Logger::parseLevel(env);
  return opts;
}

} // namespace dedupfs
