#include "utilities/var_dir.hpp"

#include "utilities/logger.h"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace quickshare {

static std::string varDir = [] {
  const char *env = std::getenv("QUICKSHARE_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/quickshare"))
    return std::string("/var/quickshare");
  return std::string("var/quickshare");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string logPathFor(const std::string &program) {
  return logsDir() + "/" + program + ".log";
}

std::string resolveLogFile(const std::string &configured,
                           const std::string &program, std::string &warning) {
  warning.clear();
  if (!configured.empty()) {
    return configured;
  }
  std::error_code ec;
  std::filesystem::create_directories(logsDir(), ec);
  if (ec) {
    warning = "cannot create " + logsDir() + " (" + ec.message() +
              "), logging to console";
    return Logger::CONSOLE_ONLY_OUTPUT;
  }
  return logPathFor(program);
}

} // namespace quickshare
