#ifndef OCRBATCH_PIPELINE_HPP
#define OCRBATCH_PIPELINE_HPP

#include "ocrbatch/ImagePreprocessor.hpp"
#include "ocrbatch/OcrEngine.hpp"
#include "ocrbatch/PageRasterizer.hpp"
#include "ocrbatch/PageTypes.hpp"
#include "ocrbatch/PipelineConfig.hpp"
#include "ocrbatch/ResultWriter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ocrbatch {

/**
 * @brief Totals for one pipeline run
 */
struct RunSummary {
  int totalItems = 0;     ///< Items pulled from the page stream
  int processedItems = 0; ///< Items recognized and saved
  int errorItems = 0;     ///< Failed stream items plus failed pages
  double totalTimeSec = 0.0;
  std::vector<double> successfulItemTimes; ///< Seconds per saved item
  int exitCode = 0;
};

/**
 * @brief Result of processing a single page
 */
struct ItemResult {
  bool success = false;     ///< Whether the page was saved
  std::string errorMessage; ///< Stage and reason if failed
  double durationSec = 0.0; ///< Time spent on the page
  std::string outputPath;   ///< Written JSON file
};

/**
 * @brief Drives scan, preprocess, OCR, cleanup and save for a whole run
 *
 * Every failed stream item and every page that fails a stage is counted as
 * an error; the run itself always continues to the end of the stream.
 */
class Pipeline {
public:
  Pipeline(const PipelineConfig &config,
           std::shared_ptr<PageRasterizer> rasterizer);

  /**
   * @brief Check directories, initialize OCR and process every page
   * @return RunSummary including the process exit code
   */
  RunSummary run();

  /**
   * @brief Process one decoded page through the downstream stages
   * @param descriptor Page identity
   * @param image Decoded page; released when processing finishes
   */
  ItemResult processItem(const PageDescriptor &descriptor, RasterImage image);

  /**
   * @brief Exit code for the given counts
   *
   * 0 when something was processed, or when nothing was found and nothing
   * failed; 1 otherwise.
   */
  static int exitCodeFor(int totalItems, int processedItems, int errorItems);

private:
  bool prepareDirectories();
  void logSummary(const RunSummary &summary) const;

  PipelineConfig m_config;
  std::shared_ptr<PageRasterizer> m_rasterizer;
  ImagePreprocessor m_preprocessor;
  OcrEngine m_ocr;
  ResultWriter m_writer;
};

} // namespace ocrbatch

#endif // OCRBATCH_PIPELINE_HPP
