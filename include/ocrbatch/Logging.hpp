#ifndef OCRBATCH_LOGGING_HPP
#define OCRBATCH_LOGGING_HPP

#include <spdlog/common.h>

#include <string>

namespace ocrbatch {

/**
 * @brief Logging destinations and verbosity
 */
struct LoggingConfig {
  std::string level = "INFO"; ///< TRACE, DEBUG, INFO, WARNING, ERROR, CRITICAL
  std::string logFile;        ///< Rotating log file; empty disables it
  bool logToConsole = true;   ///< Colored output on stdout
};

/**
 * @brief Parse a level name (case-insensitive); unknown names give info
 */
spdlog::level::level_enum parseLogLevel(const std::string &level);

/**
 * @brief Replace the default spdlog logger according to the configuration
 *
 * The console sink colors level names only when stdout is a terminal. The
 * file sink rotates at 10 MiB keeping 5 backups. If the file sink cannot be
 * created the error is logged and only the console sink is kept.
 */
void setupLogging(const LoggingConfig &config);

} // namespace ocrbatch

#endif // OCRBATCH_LOGGING_HPP
