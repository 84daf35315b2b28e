#include "ocrbatch/OcrEngine.hpp"

#include <chrono>
#include <cstdlib>
#include <sstream>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace ocrbatch {

OcrEngine::OcrEngine()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

OcrEngine::OcrEngine(const OcrConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OcrEngine::~OcrEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

OcrEngine::OcrEngine(OcrEngine &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

OcrEngine &OcrEngine::operator=(OcrEngine &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool OcrEngine::initialize() {
  if (m_initialized) {
    return true;
  }
  if (!m_tesseract) {
    spdlog::error("OCR engine has been moved from");
    return false;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else {
      // Priority 3: Let Tesseract use its compiled-in default
      spdlog::debug("TESSDATA_PREFIX not set, using Tesseract default");
    }
  }

  int result = m_tesseract->Init(
      tessDataPath, m_config.language.c_str(),
      static_cast<tesseract::OcrEngineMode>(m_config.engineMode));

  if (result != 0) {
    spdlog::critical("Failed to initialize Tesseract with language '{}' "
                     "(tessdata: {})",
                     m_config.language,
                     tessDataPath ? tessDataPath : "default");
    return false;
  }

  m_tesseract->SetPageSegMode(
      static_cast<tesseract::PageSegMode>(m_config.pageSegMode));

  for (const auto &variable : m_config.variables) {
    if (!m_tesseract->SetVariable(variable.first.c_str(),
                                  variable.second.c_str())) {
      spdlog::warn("Tesseract rejected variable {}={}", variable.first,
                   variable.second);
    }
  }

  m_initialized = true;
  spdlog::info("OCR parameters: language='{}', config='{}'", m_config.language,
               configString());
  return true;
}

bool OcrEngine::isInitialized() const { return m_initialized; }

OcrResult OcrEngine::recognize(const RasterImage &image) {
  OcrResult result;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    RasterImage source = image;
    if (image.depth() != CV_8U) {
      spdlog::warn("Image depth is not 8-bit, converting before OCR");
      double minValue = 0.0;
      double maxValue = 0.0;
      cv::minMaxLoc(image.reshape(1), &minValue, &maxValue);
      double scale = (maxValue <= 1.0 && minValue >= 0.0) ? 255.0 : 1.0;
      image.convertTo(source, CV_8U, scale);
    }

    setImage(source);

    char *outText = m_tesseract->GetUTF8Text();
    if (outText) {
      result.text = outText;
      delete[] outText;
      result.success = true;
    } else {
      result.errorMessage = "Tesseract returned no text";
    }
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR failed: ") + e.what();
  }

  m_tesseract->Clear();

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (result.success) {
    spdlog::debug("OCR complete. Characters extracted: {}", result.text.size());
  }
  return result;
}

std::string OcrEngine::configString() const {
  std::ostringstream out;
  out << "--psm " << m_config.pageSegMode << " --oem " << m_config.engineMode;
  for (const auto &variable : m_config.variables) {
    out << " -c " << variable.first << "=" << variable.second;
  }
  return out.str();
}

const OcrConfig &OcrEngine::getConfig() const { return m_config; }

std::string OcrEngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

void OcrEngine::setImage(const RasterImage &image) {
  RasterImage rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels, so rgbImage may go out of scope afterwards
  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace ocrbatch
