#pragma once

#include <string>

namespace merkseal {

// Root of all runtime state. Defaults to $MERKSEAL_VAR_DIR, else "var".
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string batchesDir();
std::string logsDir();

} // namespace merkseal
