#pragma once

#include <string>

namespace quickshare {

/// Runtime state root: $QUICKSHARE_VAR_DIR, else /var/quickshare if it
/// exists, else var/quickshare relative to the working directory.
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();

/// <logs>/<program>.log
std::string logPathFor(const std::string &program);

/**
 * @brief Choose where @p program writes its log.
 *
 * A non-empty @p configured path is used as is. Otherwise the logs directory
 * is created and logPathFor(program) returned. If the directory cannot be
 * created the result is Logger::CONSOLE_ONLY_OUTPUT and @p warning explains
 * why.
 */
std::string resolveLogFile(const std::string &configured,
                           const std::string &program, std::string &warning);

} // namespace quickshare
