#include "utilities/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tfs {

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("TFS_CONFIG");
  if (!cfg || cfg[0] == '\0')
    cfg = "tfs_config.yaml";
  return loadRuntimeOptions(cfg);
}

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["var_dir"])
        opts.varDir = node["var_dir"].as<std::string>();
      if (node["log_level"])
        opts.logLevel = logLevelFromString(node["log_level"].as<std::string>());
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["max_log_size"])
        opts.maxLogSize = node["max_log_size"].as<long long>();
      if (node["max_log_backups"])
        opts.maxLogBackups = node["max_log_backups"].as<int>();
      if (node["owner"])
        opts.owner = node["owner"].as<std::string>();
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid configuration " + path + ": " +
                               e.what());
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error("Invalid configuration " + path + ": " +
                               e.what());
    }
  }
  if (const char *env = std::getenv("TFS_VAR_DIR"))
    opts.varDir = env;
  if (const char *env = std::getenv("TFS_LOG_LEVEL")) {
    try {
      opts.logLevel = logLevelFromString(env);
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(std::string("Invalid TFS_LOG_LEVEL: ") +
                               e.what());
    }
  }
  if (const char *env = std::getenv("TFS_OWNER"))
    opts.owner = env;
  return opts;
}

} // namespace tfs
