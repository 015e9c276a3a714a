#include "utilities/var_dir.hpp"

#include <cstdlib>

namespace merkseal {

static std::string varDir = [] {
  const char *env = std::getenv("MERKSEAL_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  return std::string("var");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string batchesDir() { return getVarDir() + "/batches"; }

std::string logsDir() { return getVarDir() + "/logs"; }

} // namespace merkseal
