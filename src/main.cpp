#include "ocrbatch/Logging.hpp"
#include "ocrbatch/OcrEngine.hpp"
#include "ocrbatch/Pipeline.hpp"
#include "ocrbatch/PipelineConfig.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <opencv2/core/version.hpp>
#include <spdlog/spdlog.h>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options]\n"
      << "\nOptions:\n"
      << "  --config <file>         Configuration file (default: config.json)\n"
      << "  -i, --input <dir>       Override the input directory\n"
      << "  -o, --output <dir>      Override the output directory\n"
      << "  -d, --dpi <n>           Override the PDF render resolution\n"
      << "  -l, --language <lang>   Override the OCR language (e.g. rus+eng)\n"
      << "  -v, --verbose           Log at DEBUG level\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << "\n"
      << "  " << programName << " --config batch.json -v\n"
      << "  " << programName << " -i scans -o results -d 200 -l rus+eng\n";
}

int main(int argc, char *argv[]) {
  std::string configPath = "config.json";
  std::optional<std::string> inputDir;
  std::optional<std::string> outputDir;
  std::optional<std::string> language;
  std::optional<int> dpi;
  bool verbose = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "--config" || arg == "-i" || arg == "--input" ||
               arg == "-o" || arg == "--output" || arg == "-d" ||
               arg == "--dpi" || arg == "-l" || arg == "--language") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires an argument\n";
        return 1;
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        configPath = value;
      } else if (arg == "-i" || arg == "--input") {
        inputDir = value;
      } else if (arg == "-o" || arg == "--output") {
        outputDir = value;
      } else if (arg == "-l" || arg == "--language") {
        language = value;
      } else {
        std::size_t parsed = 0;
        try {
          dpi = std::stoi(value, &parsed);
        } catch (const std::exception &) {
          parsed = 0;
        }
        if (parsed == 0 || parsed != value.size()) {
          std::cerr << "Error: --dpi expects an integer, got '" << value
                    << "'\n";
          return 1;
        }
      }
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  // Console logging until the configured sinks are known
  ocrbatch::LoggingConfig bootstrap;
  bootstrap.level = verbose ? "DEBUG" : "INFO";
  ocrbatch::setupLogging(bootstrap);

  ocrbatch::ConfigLoadResult loaded = ocrbatch::loadConfig(configPath);
  if (!loaded.success) {
    spdlog::critical("Configuration error: {}", loaded.errorMessage);
    return 1;
  }

  ocrbatch::PipelineConfig config = loaded.config;
  if (inputDir) {
    config.inputDir = *inputDir;
  }
  if (outputDir) {
    config.output.outputDir = *outputDir;
  }
  if (language) {
    config.ocr.language = *language;
  }
  if (dpi) {
    if (*dpi <= 0 || *dpi > ocrbatch::kMaxPdfDpi) {
      spdlog::critical("PDF DPI must be between 1 and {}, got {}",
                       ocrbatch::kMaxPdfDpi, *dpi);
      return 1;
    }
    config.scan.pdfDpi = *dpi;
  }
  if (verbose) {
    config.logging.level = "DEBUG";
  }

  ocrbatch::setupLogging(config.logging);
  ocrbatch::PopplerRasterizer::installPopplerLogHandler();

  spdlog::info("Tesseract version: {}",
               ocrbatch::OcrEngine::getTesseractVersion());
  spdlog::info("OpenCV version: {}", CV_VERSION);
  spdlog::info("OCR language: {}, PDF DPI: {}", config.ocr.language,
               config.scan.pdfDpi);

  try {
    auto rasterizer =
        std::make_shared<ocrbatch::PopplerRasterizer>(config.rasterizer);
    ocrbatch::Pipeline pipeline(config, rasterizer);
    ocrbatch::RunSummary summary = pipeline.run();
    return summary.exitCode;
  } catch (const std::exception &e) {
    spdlog::critical("Unexpected error in pipeline: {}", e.what());
    return 1;
  }
}
