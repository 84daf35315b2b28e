#ifndef OCRBATCH_OCR_ENGINE_HPP
#define OCRBATCH_OCR_ENGINE_HPP

#include "ocrbatch/PageTypes.hpp"

#include <tesseract/baseapi.h>

#include <map>
#include <memory>
#include <string>

namespace ocrbatch {

/**
 * @brief Configuration options for Tesseract
 */
struct OcrConfig {
  std::string language = "rus"; ///< Language code(s), e.g. "rus+eng"
  std::string tessDataPath;     ///< Path to tessdata (empty = environment)
  int pageSegMode = tesseract::PSM_AUTO;     ///< Page segmentation mode
  int engineMode = tesseract::OEM_DEFAULT;   ///< OCR engine mode
  std::map<std::string, std::string> variables; ///< Passed to SetVariable
};

/**
 * @brief Result of recognizing one page
 */
struct OcrResult {
  bool success = false;        ///< Whether OCR was successful
  std::string errorMessage;    ///< Error message if failed
  std::string text;            ///< Raw recognized text (UTF-8)
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Text recognition using Tesseract
 *
 * Example usage:
 * @code
 * ocrbatch::OcrEngine engine;
 * if (engine.initialize()) {
 *     auto result = engine.recognize(page);
 *     if (result.success) {
 *         std::cout << result.text << std::endl;
 *     }
 * }
 * @endcode
 */
class OcrEngine {
public:
  OcrEngine();
  explicit OcrEngine(const OcrConfig &config);
  ~OcrEngine();

  // Tesseract API is not copyable
  OcrEngine(const OcrEngine &) = delete;
  OcrEngine &operator=(const OcrEngine &) = delete;

  OcrEngine(OcrEngine &&other) noexcept;
  OcrEngine &operator=(OcrEngine &&other) noexcept;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Recognize text in an image
   * @param image 8-bit image with 1, 3 or 4 channels (other depths are
   * converted)
   * @return OcrResult containing the raw text
   */
  OcrResult recognize(const RasterImage &image);

  /**
   * @brief Command-line style summary of the settings, e.g. "--psm 3 --oem 3"
   */
  std::string configString() const;

  const OcrConfig &getConfig() const;

  static std::string getTesseractVersion();

private:
  void setImage(const RasterImage &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract; ///< Tesseract instance
  OcrConfig m_config;                                  ///< Current configuration
  bool m_initialized;                                  ///< Initialization state
};

} // namespace ocrbatch

#endif // OCRBATCH_OCR_ENGINE_HPP
