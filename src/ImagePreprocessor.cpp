#include "ocrbatch/ImagePreprocessor.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace ocrbatch {

namespace {

const std::string kMedianPrefix = "median_";

// Rotations at or below this many degrees are left alone
constexpr double kMinSkewDegrees = 0.5;
constexpr double kMaxSkewDegrees = 45.0;

RasterImage toBgr(const RasterImage &image) {
  RasterImage source = image;
  if (image.depth() != CV_8U) {
    double minValue = 0.0;
    double maxValue = 0.0;
    cv::minMaxLoc(image.reshape(1), &minValue, &maxValue);
    double scale = (maxValue <= 1.0 && minValue >= 0.0) ? 255.0 : 1.0;
    image.convertTo(source, CV_8U, scale);
  }

  RasterImage bgr;
  if (source.channels() == 1) {
    cv::cvtColor(source, bgr, cv::COLOR_GRAY2BGR);
  } else if (source.channels() == 4) {
    cv::cvtColor(source, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = source.clone();
  }
  return bgr;
}

} // namespace

ImagePreprocessor::ImagePreprocessor() : m_config() {}

ImagePreprocessor::ImagePreprocessor(const PreprocessingConfig &config)
    : m_config(config) {}

PreprocessResult ImagePreprocessor::process(const RasterImage &image) const {
  PreprocessResult result;

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  try {
    if (!m_config.enabled) {
      spdlog::debug("Preprocessing disabled in configuration");
      result.image = toBgr(image);
      result.success = true;
      return result;
    }

    RasterImage working = toBgr(image);
    RasterImage gray;

    bool needGray = m_config.grayscale || m_config.deskew ||
                    !m_config.binarizationMethod.empty();
    if (needGray) {
      try {
        cv::cvtColor(working, gray, cv::COLOR_BGR2GRAY);
        working = gray;
        spdlog::debug("Converted image to grayscale");
      } catch (const cv::Exception &e) {
        spdlog::warn("Grayscale conversion failed: {}. Continuing with BGR",
                     e.what());
        gray.release();
      }
    }

    if (m_config.deskew && !gray.empty()) {
      working = deskew(working, gray, result.skewAngle);
      if (working.channels() == 1) {
        gray = working;
      }
    }

    if (!m_config.binarizationMethod.empty()) {
      if (gray.empty()) {
        spdlog::warn("Binarization skipped: no grayscale image available");
      } else {
        RasterImage binary;
        if (binarize(gray, binary)) {
          working = binary;
        }
      }
    }

    if (!m_config.noiseRemoval.empty()) {
      RasterImage denoised;
      if (removeNoise(working, denoised)) {
        working = denoised;
      }
    }

    result.image = working;
    result.success = true;
    spdlog::debug("Preprocessing complete. Result {}x{}x{}", result.image.cols,
                  result.image.rows, result.image.channels());
  } catch (const cv::Exception &e) {
    result.errorMessage = std::string("Preprocessing failed: ") + e.what();
    result.image.release();
  }

  return result;
}

bool ImagePreprocessor::estimateSkew(const RasterImage &gray, double &angle) {
  RasterImage thresh;
  cv::threshold(gray, thresh, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  std::vector<cv::Point> coords;
  cv::findNonZero(thresh, coords);
  if (coords.size() < 5) {
    return false;
  }

  // minAreaRect reports [-90, 0) or [0, 90) depending on the OpenCV version;
  // fold either range into (-45, 45]
  angle = cv::minAreaRect(coords).angle;
  if (angle > 45.0) {
    angle -= 90.0;
  } else if (angle <= -45.0) {
    angle += 90.0;
  }
  return true;
}

RasterImage ImagePreprocessor::deskew(const RasterImage &image,
                                      const RasterImage &gray,
                                      double &appliedAngle) const {
  appliedAngle = 0.0;

  try {
    double angle = 0.0;
    if (!estimateSkew(gray, angle)) {
      spdlog::warn("Not enough foreground pixels to estimate skew. Skipping "
                   "deskew");
      return image;
    }

    spdlog::info("Detected skew angle: {:.2f} degrees", angle);
    if (std::abs(angle) <= kMinSkewDegrees ||
        std::abs(angle) >= kMaxSkewDegrees) {
      spdlog::debug("Skew angle {:.2f} outside correction range, not rotating",
                    angle);
      return image;
    }

    cv::Point2f center(image.cols / 2.0f, image.rows / 2.0f);
    cv::Mat rotation = cv::getRotationMatrix2D(center, angle, 1.0);
    cv::Scalar white = image.channels() == 1 ? cv::Scalar(255)
                                             : cv::Scalar(255, 255, 255);

    RasterImage rotated;
    cv::warpAffine(image, rotated, rotation, image.size(), cv::INTER_CUBIC,
                   cv::BORDER_CONSTANT, white);
    appliedAngle = angle;
    return rotated;
  } catch (const cv::Exception &e) {
    spdlog::error("Deskew failed: {}", e.what());
    return image;
  }
}

bool ImagePreprocessor::binarize(const RasterImage &gray,
                                 RasterImage &out) const {
  const std::string &method = m_config.binarizationMethod;

  try {
    if (method == "otsu") {
      cv::threshold(gray, out, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
      spdlog::debug("Applied Otsu binarization");
      return true;
    }

    if (method == "adaptive") {
      int blockSize = m_config.adaptiveBlockSize;
      if (blockSize < 3 || blockSize % 2 == 0) {
        spdlog::warn("Adaptive threshold block size must be odd and > 1, got "
                     "{}. Skipping binarization",
                     blockSize);
        return false;
      }
      cv::adaptiveThreshold(gray, out, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                            cv::THRESH_BINARY, blockSize, m_config.adaptiveC);
      spdlog::debug("Applied adaptive binarization (block: {}, C: {})",
                    blockSize, m_config.adaptiveC);
      return true;
    }

    spdlog::warn("Unknown binarization method: {}. Skipping binarization",
                 method);
  } catch (const cv::Exception &e) {
    spdlog::error("Binarization failed: {}", e.what());
  }
  return false;
}

bool ImagePreprocessor::removeNoise(const RasterImage &image,
                                    RasterImage &out) const {
  const std::string &method = m_config.noiseRemoval;

  if (method.rfind(kMedianPrefix, 0) != 0) {
    spdlog::warn("Unknown noise removal method: {}. Skipping", method);
    return false;
  }

  int kernelSize = 0;
  try {
    size_t consumed = 0;
    std::string sizeText = method.substr(kMedianPrefix.size());
    kernelSize = std::stoi(sizeText, &consumed);
    if (consumed != sizeText.size()) {
      throw std::invalid_argument(sizeText);
    }
  } catch (const std::logic_error &) {
    spdlog::warn("Invalid kernel size in noise_removal: {}. Skipping", method);
    return false;
  }

  if (kernelSize < 1 || kernelSize % 2 == 0) {
    spdlog::warn("Median blur kernel size must be odd, got {}. Skipping",
                 kernelSize);
    return false;
  }

  try {
    cv::medianBlur(image, out, kernelSize);
    spdlog::debug("Applied median blur with kernel {}x{}", kernelSize,
                  kernelSize);
    return true;
  } catch (const cv::Exception &e) {
    spdlog::error("Noise removal failed: {}", e.what());
  }
  return false;
}

} // namespace ocrbatch
