#include "ocrbatch/Pipeline.hpp"

#include "ocrbatch/PageStream.hpp"
#include "ocrbatch/TextCleaner.hpp"

#include <chrono>
#include <filesystem>
#include <numeric>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ocrbatch {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

} // namespace

Pipeline::Pipeline(const PipelineConfig &config,
                   std::shared_ptr<PageRasterizer> rasterizer)
    : m_config(config), m_rasterizer(std::move(rasterizer)),
      m_preprocessor(config.preprocessing), m_ocr(config.ocr),
      m_writer(config.output) {
  if (!m_rasterizer) {
    throw std::invalid_argument("Pipeline requires a rasterizer");
  }
}

int Pipeline::exitCodeFor(int totalItems, int processedItems,
                          int errorItems) {
  if (processedItems > 0 || (totalItems == 0 && errorItems == 0)) {
    return 0;
  }
  return 1;
}

bool Pipeline::prepareDirectories() {
  std::error_code ec;
  if (!fs::is_directory(m_config.inputDir, ec)) {
    spdlog::critical("Input directory NOT FOUND: {}", m_config.inputDir);
    return false;
  }

  const std::string &outputDir = m_config.output.outputDir;
  if (!fs::exists(outputDir, ec)) {
    if (!fs::create_directories(outputDir, ec) || ec) {
      spdlog::critical("Failed to create output directory {}: {}", outputDir,
                       ec.message());
      return false;
    }
    spdlog::info("Created output directory: {}", outputDir);
  } else if (!fs::is_directory(outputDir, ec)) {
    spdlog::critical("Output path '{}' exists but is not a directory",
                     outputDir);
    return false;
  }
  return true;
}

RunSummary Pipeline::run() {
  auto startTime = std::chrono::steady_clock::now();
  RunSummary summary;

  spdlog::info("============================== Starting OCR pipeline "
               "==============================");
  spdlog::info("Input directory: {}", m_config.inputDir);
  spdlog::info("Output directory: {}", m_config.output.outputDir);

  if (!prepareDirectories()) {
    summary.exitCode = 1;
    return summary;
  }

  if (!m_ocr.initialize()) {
    spdlog::critical("Failed to initialize OCR engine. Make sure Tesseract "
                     "is installed and tessdata is available");
    summary.exitCode = 1;
    return summary;
  }

  spdlog::info("Scanning '{}' and processing documents...", m_config.inputDir);
  PageStream stream = scan(m_config.inputDir, m_config.scan, m_rasterizer);

  for (PageItem &item : stream) {
    ++summary.totalItems;

    if (const auto *failure = std::get_if<PageFailure>(&item)) {
      std::string prefix = failure->descriptor
                               ? logPrefix(*failure->descriptor) + " (?)"
                               : std::string("[Unknown Item]");
      spdlog::error("{} Item could not be acquired ({}): {}. Skipped", prefix,
                    errorKindName(failure->kind), failure->message);
      ++summary.errorItems;
      continue;
    }

    PageOk &page = std::get<PageOk>(item);
    ItemResult result = processItem(page.descriptor, std::move(page.image));
    if (result.success) {
      ++summary.processedItems;
      summary.successfulItemTimes.push_back(result.durationSec);
    } else {
      ++summary.errorItems;
    }
  }

  summary.totalTimeSec = secondsSince(startTime);
  summary.exitCode = exitCodeFor(summary.totalItems, summary.processedItems,
                                 summary.errorItems);
  logSummary(summary);
  return summary;
}

ItemResult Pipeline::processItem(const PageDescriptor &descriptor,
                                 RasterImage image) {
  auto startTime = std::chrono::steady_clock::now();
  std::string prefix = logPrefix(descriptor);
  ItemResult result;

  spdlog::info("{} Processing started (source: '{}')", prefix,
               descriptor.relativePath);

  PreprocessResult preprocessed = m_preprocessor.process(image);
  image.release();
  if (!preprocessed.success) {
    result.errorMessage = "Preprocessing failed: " + preprocessed.errorMessage;
  }

  OcrResult ocr;
  if (result.errorMessage.empty()) {
    spdlog::debug("{} Preprocessing complete", prefix);
    ocr = m_ocr.recognize(preprocessed.image);
    preprocessed.image.release();
    if (!ocr.success) {
      result.errorMessage = "OCR failed: " + ocr.errorMessage;
    }
  }

  if (result.errorMessage.empty()) {
    spdlog::debug("{} OCR complete, text length: {}", prefix, ocr.text.size());

    PageRecord record;
    record.descriptor = descriptor;
    record.text = cleanText(ocr.text);
    record.timestampUtc = currentTimestampUtc();
    record.durationSec = secondsSince(startTime);
    record.ocrLanguage = m_ocr.getConfig().language;
    record.tesseractConfig = m_ocr.configString();

    SaveResult saved = m_writer.save(record);
    if (saved.success) {
      result.outputPath = saved.outputPath;
    } else {
      result.errorMessage = "Saving failed: " + saved.errorMessage;
    }
  }

  result.durationSec = secondsSince(startTime);
  if (result.errorMessage.empty()) {
    result.success = true;
    spdlog::info("{} Processed and saved in {:.2f} sec", prefix,
                 result.durationSec);
  } else {
    spdlog::error("{} Failed to process item ({}). Time until failure: "
                  "{:.2f} sec",
                  prefix, result.errorMessage, result.durationSec);
  }
  return result;
}

void Pipeline::logSummary(const RunSummary &summary) const {
  spdlog::info("============================== OCR pipeline finished "
               "==============================");
  spdlog::info("Total items found/attempted: {}", summary.totalItems);
  spdlog::info("Successfully processed and saved: {}", summary.processedItems);
  spdlog::info("Items with errors: {}", summary.errorItems);
  spdlog::info("Total run time: {:.2f} sec", summary.totalTimeSec);

  if (summary.totalItems > 0) {
    spdlog::info("Average time per item (all attempts): {:.2f} sec",
                 summary.totalTimeSec / summary.totalItems);
  }
  if (summary.processedItems > 0) {
    double successfulTime =
        std::accumulate(summary.successfulItemTimes.begin(),
                        summary.successfulItemTimes.end(), 0.0);
    spdlog::info("Average time per SUCCESSFUL item: {:.2f} sec",
                 successfulTime / summary.processedItems);
  } else if (summary.totalItems > 0) {
    spdlog::info("Average time per successful item: N/A (none succeeded)");
  } else {
    spdlog::warn("No supported files were found in the input directory");
  }

  if (summary.errorItems > 0) {
    spdlog::warn("Finished with {} errors", summary.errorItems);
  } else if (summary.processedItems == 0 && summary.totalItems > 0) {
    spdlog::warn("No item was processed successfully");
  }
  spdlog::info("Exiting with code {}", summary.exitCode);
}

} // namespace ocrbatch
