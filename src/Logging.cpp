#include "ocrbatch/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ocrbatch {

namespace {

const char *kLoggerName = "ocrbatch";
const char *kPattern = "%Y-%m-%d %H:%M:%S - %n - [%^%l%$] - %v";
constexpr std::size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;

} // namespace

spdlog::level::level_enum parseLogLevel(const std::string &level) {
  std::string upper = level;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "TRACE") {
    return spdlog::level::trace;
  }
  if (upper == "DEBUG") {
    return spdlog::level::debug;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return spdlog::level::warn;
  }
  if (upper == "ERROR") {
    return spdlog::level::err;
  }
  if (upper == "CRITICAL") {
    return spdlog::level::critical;
  }
  return spdlog::level::info;
}

void setupLogging(const LoggingConfig &config) {
  spdlog::level::level_enum level = parseLogLevel(config.level);
  std::vector<spdlog::sink_ptr> sinks;

  if (config.logToConsole) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
        spdlog::color_mode::automatic);
    console->set_level(level);
    sinks.push_back(console);
  }

  std::string fileError;
  if (!config.logFile.empty()) {
    try {
      std::filesystem::path parent =
          std::filesystem::path(config.logFile).parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          config.logFile, kMaxLogFileSize, kMaxLogFiles);
      file->set_level(level);
      sinks.push_back(file);
    } catch (const std::exception &e) {
      fileError = e.what();
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern(kPattern);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!fileError.empty()) {
    spdlog::error("Failed to set up file logging for '{}': {}", config.logFile,
                  fileError);
  }

  spdlog::debug("Logging configured. Level: {}", config.level);
  if (!config.logFile.empty() && fileError.empty()) {
    spdlog::debug("Logging to file: {}", config.logFile);
  }
}

} // namespace ocrbatch
