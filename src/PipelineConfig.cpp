#include "ocrbatch/PipelineConfig.hpp"

#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ocrbatch {

namespace {

// Absent or null keys yield an empty string
std::string nullableString(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::string();
  }
  return it->get<std::string>();
}

// Integer keys must hold a JSON integer that fits in an int; floats and
// out-of-range values are rejected rather than truncated
int integerValue(const nlohmann::json &object, const char *key,
                 int defaultValue) {
  auto it = object.find(key);
  if (it == object.end()) {
    return defaultValue;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument("'" + std::string(key) +
                                "' must be an integer, got " + it->dump());
  }

  bool inRange;
  if (it->is_number_unsigned()) {
    inRange = it->get<std::uint64_t>() <=
              static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  } else {
    std::int64_t value = it->get<std::int64_t>();
    inRange = value >= std::numeric_limits<int>::min() &&
              value <= std::numeric_limits<int>::max();
  }
  if (!inRange) {
    throw std::invalid_argument("'" + std::string(key) +
                                "' is out of range: " + it->dump());
  }
  return it->get<int>();
}

std::string resolveDirectory(const std::string &directory,
                             const std::string &baseDir) {
  fs::path path(directory);
  if (path.is_relative() && !baseDir.empty()) {
    path = fs::path(baseDir) / path;
  }
  return path.lexically_normal().string();
}

void parsePreprocessing(const nlohmann::json &section,
                        PreprocessingConfig &config) {
  config.enabled = section.value("enabled", config.enabled);
  config.grayscale = section.value("grayscale", config.grayscale);
  config.deskew = section.value("deskew", config.deskew);
  config.binarizationMethod = nullableString(section, "binarization_method");
  config.adaptiveBlockSize = integerValue(section, "adaptive_thresh_block_size",
                                          config.adaptiveBlockSize);
  config.adaptiveC = section.value("adaptive_thresh_C", config.adaptiveC);
  config.noiseRemoval = nullableString(section, "noise_removal");
}

void parseLogging(const nlohmann::json &section, LoggingConfig &config) {
  config.level = section.value("level", config.level);
  config.logFile = nullableString(section, "log_file");
  config.logToConsole = section.value("log_to_console", config.logToConsole);
}

} // namespace

ConfigLoadResult parseConfig(const nlohmann::json &document,
                             const std::string &baseDir) {
  ConfigLoadResult result;
  PipelineConfig &config = result.config;

  if (!document.is_object()) {
    result.errorMessage = "Configuration must be a JSON object";
    return result;
  }

  try {
    config.inputDir = resolveDirectory(
        document.value("input_dir", config.inputDir), baseDir);
    config.output.outputDir = resolveDirectory(
        document.value("output_dir", config.output.outputDir), baseDir);
    config.output.format = document.value("output_format", config.output.format);
    config.output.nameFromRelativePath = document.value(
        "name_from_relative_path", config.output.nameFromRelativePath);

    config.scan.pdfDpi = integerValue(document, "pdf_dpi", config.scan.pdfDpi);
    config.scan.sortEntries =
        document.value("sort_entries", config.scan.sortEntries);
    config.scan.followSymlinks =
        document.value("follow_symlinks", config.scan.followSymlinks);
    config.rasterizer.pdfPassword = nullableString(document, "pdf_password");

    config.ocr.language = document.value("ocr_language", config.ocr.language);
    config.ocr.tessDataPath = nullableString(document, "tessdata_dir");
    config.ocr.pageSegMode =
        integerValue(document, "ocr_psm", config.ocr.pageSegMode);
    config.ocr.engineMode =
        integerValue(document, "ocr_oem", config.ocr.engineMode);

    auto variables = document.find("tesseract_variables");
    if (variables != document.end() && !variables->is_null()) {
      if (!variables->is_object()) {
        result.errorMessage = "'tesseract_variables' must be an object";
        return result;
      }
      for (auto it = variables->begin(); it != variables->end(); ++it) {
        config.ocr.variables[it.key()] =
            it->is_string() ? it->get<std::string>() : it->dump();
      }
    }

    auto preprocessing = document.find("preprocessing");
    if (preprocessing != document.end() && !preprocessing->is_null()) {
      parsePreprocessing(*preprocessing, config.preprocessing);
    }

    auto logging = document.find("logging");
    if (logging != document.end() && !logging->is_null()) {
      parseLogging(*logging, config.logging);
    }
  } catch (const nlohmann::json::exception &e) {
    result.errorMessage = std::string("Invalid configuration value: ") +
                          e.what();
    return result;
  } catch (const std::invalid_argument &e) {
    result.errorMessage = e.what();
    return result;
  }

  if (config.scan.pdfDpi <= 0 || config.scan.pdfDpi > kMaxPdfDpi) {
    result.errorMessage = "'pdf_dpi' must be an integer between 1 and " +
                          std::to_string(kMaxPdfDpi) + ", got " +
                          std::to_string(config.scan.pdfDpi);
    return result;
  }

  result.success = true;
  return result;
}

ConfigLoadResult loadConfig(const std::string &configPath) {
  ConfigLoadResult result;

  spdlog::info("Loading configuration from: {}", configPath);

  std::ifstream in(configPath);
  if (!in) {
    result.errorMessage = "Configuration file '" + configPath + "' not found";
    return result;
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error &e) {
    result.errorMessage = "Failed to parse configuration file '" + configPath +
                          "': " + e.what();
    return result;
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(configPath, ec);
  std::string baseDir =
      ec ? fs::path(configPath).parent_path().string()
         : absolute.parent_path().string();

  result = parseConfig(document, baseDir);
  if (result.success) {
    spdlog::info("Configuration loaded successfully");
  }
  return result;
}

} // namespace ocrbatch
