#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace tfs {

static std::string varDir = [] {
  const char *env = std::getenv("TFS_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/tfs"))
    return std::string("/var/tfs");
  return std::string("var/tfs");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string ledgerDir() { return getVarDir() + "/ledger"; }

std::string chunksDir() { return getVarDir() + "/chunks"; }

} // namespace tfs
