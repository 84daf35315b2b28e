#ifndef OCRBATCH_RESULT_WRITER_HPP
#define OCRBATCH_RESULT_WRITER_HPP

#include "ocrbatch/PageTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ocrbatch {

/**
 * @brief Everything recorded about one processed page
 */
struct PageRecord {
  PageDescriptor descriptor;
  std::string timestampUtc;        ///< ISO 8601, milliseconds, 'Z' suffix
  double durationSec = 0.0;        ///< Wall time spent on the page
  std::string ocrLanguage;         ///< Tesseract language(s) used
  std::string tesseractConfig;     ///< Engine settings used
  std::string text;                ///< Cleaned text
};

/**
 * @brief Options for persisting page records
 */
struct OutputConfig {
  std::string outputDir = "output_data"; ///< Destination directory
  std::string format = "json";           ///< Only "json" is supported
  bool nameFromRelativePath = false;     ///< Use relative path for naming
};

/**
 * @brief Result of saving one record
 */
struct SaveResult {
  bool success = false;     ///< Whether the file was written
  std::string errorMessage; ///< Error message if failed
  std::string outputPath;   ///< Path of the written file
};

/**
 * @brief Replace characters unsafe in file names
 *
 * Uses the base name without extension. Runs of anything other than ASCII
 * letters, digits, '_', '.', '-' and non-ASCII bytes become a single '_';
 * leading and trailing '_' are stripped. Returns "unnamed_file" if nothing
 * is left.
 */
std::string sanitizeFilename(const std::string &filename);

/**
 * @brief Output file name for a page, e.g. "report_page_3.json"
 */
std::string outputFilename(const PageDescriptor &descriptor,
                           const OutputConfig &config);

/**
 * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string currentTimestampUtc();

/**
 * @brief Build the JSON document written for a page
 */
nlohmann::json toJson(const PageRecord &record);

/**
 * @brief Writes page records as pretty-printed UTF-8 JSON files
 */
class ResultWriter {
public:
  explicit ResultWriter(const OutputConfig &config);

  /**
   * @brief Write one record, creating the output directory if needed
   * @return SaveResult; never throws
   */
  SaveResult save(const PageRecord &record) const;

private:
  OutputConfig m_config;
};

} // namespace ocrbatch

#endif // OCRBATCH_RESULT_WRITER_HPP
