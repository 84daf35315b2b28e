#include "ocrbatch/ResultWriter.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

namespace ocrbatch {

namespace {

const std::string kUnnamed = "unnamed_file";

bool isAllowed(unsigned char c) {
  // Bytes >= 0x80 belong to multi-byte UTF-8 sequences (non-Latin letters)
  return std::isalnum(c) || c == '_' || c == '.' || c == '-' || c >= 0x80;
}

std::string baseName(const std::string &path) {
  size_t slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Removes the extension of the last path component; leading dots of a
// component are not an extension
std::string stripExtension(const std::string &path) {
  size_t componentStart = path.find_last_of("/\\");
  componentStart = componentStart == std::string::npos ? 0 : componentStart + 1;

  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || dot <= componentStart) {
    return path;
  }
  size_t firstNonDot = path.find_first_not_of('.', componentStart);
  if (firstNonDot == std::string::npos || dot < firstNonDot) {
    return path;
  }
  return path.substr(0, dot);
}

std::string sanitizeStem(const std::string &stem) {
  std::string out;
  out.reserve(stem.size());

  for (char ch : stem) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (isAllowed(c)) {
      out += ch;
    } else if (out.empty() || out.back() != '_') {
      out += '_';
    }
  }

  // Collapse runs of '_' that came from the input itself
  out.erase(std::unique(out.begin(), out.end(),
                        [](char a, char b) { return a == '_' && b == '_'; }),
            out.end());

  size_t begin = out.find_first_not_of('_');
  if (begin == std::string::npos) {
    return kUnnamed;
  }
  size_t end = out.find_last_not_of('_');
  return out.substr(begin, end - begin + 1);
}

} // namespace

std::string sanitizeFilename(const std::string &filename) {
  if (filename.empty()) {
    return kUnnamed;
  }
  return sanitizeStem(stripExtension(baseName(filename)));
}

std::string outputFilename(const PageDescriptor &descriptor,
                           const OutputConfig &config) {
  std::string stem =
      config.nameFromRelativePath && !descriptor.relativePath.empty()
          ? sanitizeStem(stripExtension(descriptor.relativePath))
          : sanitizeFilename(descriptor.originalFilename);
  return stem + "_page_" + std::to_string(descriptor.pageNumber) + "." +
         config.format;
}

std::string currentTimestampUtc() {
  auto now = std::chrono::system_clock::now();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis.count() << 'Z';
  return out.str();
}

nlohmann::json toJson(const PageRecord &record) {
  const PageDescriptor &descriptor = record.descriptor;

  nlohmann::json document;
  document["document_info"] = {
      {"input_directory", descriptor.inputRootName},
      {"relative_path", descriptor.relativePath},
      {"original_filename", descriptor.originalFilename},
      {"source_type", sourceKindName(descriptor.sourceKind)},
      {"page_number", descriptor.pageNumber}};
  document["processing_info"] = {
      {"timestamp_utc", record.timestampUtc},
      {"duration_sec", std::round(record.durationSec * 100.0) / 100.0},
      {"ocr_engine_lang", record.ocrLanguage},
      {"tesseract_config_used", record.tesseractConfig}};
  document["content"] = {{"text", record.text}};
  return document;
}

ResultWriter::ResultWriter(const OutputConfig &config) : m_config(config) {}

SaveResult ResultWriter::save(const PageRecord &record) const {
  SaveResult result;

  std::string format = m_config.format;
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (format != "json") {
    result.errorMessage = "Output format '" + m_config.format +
                          "' is not supported. Only 'json' is supported";
    return result;
  }

  OutputConfig naming = m_config;
  naming.format = format;
  std::filesystem::path outputPath =
      std::filesystem::path(m_config.outputDir) /
      outputFilename(record.descriptor, naming);
  result.outputPath = outputPath.string();

  spdlog::debug("Saving result to: {}", result.outputPath);

  std::error_code ec;
  std::filesystem::create_directories(m_config.outputDir, ec);
  if (ec) {
    result.errorMessage = "Failed to create output directory " +
                          m_config.outputDir + ": " + ec.message();
    return result;
  }

  std::string serialized;
  try {
    // Invalid UTF-8 from OCR is replaced rather than aborting the page
    serialized = toJson(record).dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &e) {
    result.errorMessage =
        std::string("JSON serialization failed: ") + e.what();
    return result;
  }

  std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    result.errorMessage = "Failed to open " + result.outputPath + " for writing";
    return result;
  }
  out << serialized;
  out.close();
  if (!out) {
    result.errorMessage = "I/O error while writing " + result.outputPath;
    return result;
  }

  spdlog::info("Result saved: {}", result.outputPath);
  result.success = true;
  return result;
}

} // namespace ocrbatch
