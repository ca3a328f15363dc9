#pragma once

#include <string>

namespace tfs {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string ledgerDir();
std::string chunksDir();

} // namespace tfs
