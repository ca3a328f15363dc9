#ifndef TFS_CONFIG_HPP
#define TFS_CONFIG_HPP

#include "utilities/logger.h"

#include <string>

namespace tfs {

struct RuntimeOptions {
  std::string varDir;  ///< Empty keeps the var_dir default.
  LogLevel logLevel = LogLevel::INFO;
  std::string logFile; ///< Empty means <var>/logs/tfs.log.
  long long maxLogSize = 10 * 1024 * 1024;
  int maxLogBackups = 5;
  std::string owner = "anonymous";
};

/**
 * @brief Load options from a YAML file, then apply environment overrides.
 *
 * The file is $TFS_CONFIG, or tfs_config.yaml in the working directory when
 * unset. A missing file leaves the defaults in place. TFS_VAR_DIR,
 * TFS_LOG_LEVEL and TFS_OWNER override the file.
 *
 * @throws std::runtime_error If the file exists but cannot be parsed or a
 *         value has the wrong type.
 */
RuntimeOptions loadRuntimeOptions();

/// Same as loadRuntimeOptions() but reads @p path instead of $TFS_CONFIG.
RuntimeOptions loadRuntimeOptions(const std::string &path);

} // namespace tfs

#endif // TFS_CONFIG_HPP
