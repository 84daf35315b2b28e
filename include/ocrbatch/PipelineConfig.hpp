#ifndef OCRBATCH_PIPELINE_CONFIG_HPP
#define OCRBATCH_PIPELINE_CONFIG_HPP

#include "ocrbatch/DocumentScanner.hpp"
#include "ocrbatch/ImagePreprocessor.hpp"
#include "ocrbatch/Logging.hpp"
#include "ocrbatch/OcrEngine.hpp"
#include "ocrbatch/PageRasterizer.hpp"
#include "ocrbatch/ResultWriter.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ocrbatch {

/// Highest accepted PDF render resolution
constexpr int kMaxPdfDpi = 2400;

/**
 * @brief Complete configuration of a pipeline run
 */
struct PipelineConfig {
  std::string inputDir = "input_data"; ///< Root directory to scan
  ScanConfig scan;
  RasterizerConfig rasterizer;
  PreprocessingConfig preprocessing;
  OcrConfig ocr;
  OutputConfig output;
  LoggingConfig logging;
};

/**
 * @brief Result of loading a configuration file
 */
struct ConfigLoadResult {
  bool success = false;     ///< Whether the configuration is usable
  std::string errorMessage; ///< Error message if failed
  PipelineConfig config;    ///< Parsed configuration
};

/**
 * @brief Build a configuration from parsed JSON
 *
 * Missing keys keep their defaults and unknown keys are ignored. Relative
 * input and output directories are resolved against baseDir.
 *
 * @param document Parsed configuration object
 * @param baseDir Directory relative paths are resolved against
 * @return ConfigLoadResult; wrong value types and invalid values fail
 */
ConfigLoadResult parseConfig(const nlohmann::json &document,
                             const std::string &baseDir);

/**
 * @brief Read and parse a JSON configuration file
 * @param configPath Path to the file (e.g. "config.json")
 * @return ConfigLoadResult; a missing or malformed file fails
 */
ConfigLoadResult loadConfig(const std::string &configPath);

} // namespace ocrbatch

#endif // OCRBATCH_PIPELINE_CONFIG_HPP
