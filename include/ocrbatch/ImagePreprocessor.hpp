#ifndef OCRBATCH_IMAGE_PREPROCESSOR_HPP
#define OCRBATCH_IMAGE_PREPROCESSOR_HPP

#include "ocrbatch/PageTypes.hpp"

#include <string>

namespace ocrbatch {

/**
 * @brief Configuration options for image preprocessing
 */
struct PreprocessingConfig {
  bool enabled = false;           ///< Run the filter chain at all
  bool grayscale = true;          ///< Convert to a single channel
  bool deskew = false;            ///< Straighten rotated scans
  std::string binarizationMethod; ///< "otsu", "adaptive" or empty (none)
  int adaptiveBlockSize = 11;     ///< Neighbourhood size, odd and > 1
  double adaptiveC = 2.0;         ///< Constant subtracted from the mean
  std::string noiseRemoval;       ///< "median_<k>" with odd k, or empty
};

/**
 * @brief Result of preprocessing one page
 */
struct PreprocessResult {
  bool success = false;     ///< Whether preprocessing succeeded
  std::string errorMessage; ///< Error message if failed
  RasterImage image;        ///< Image ready for OCR
  double skewAngle = 0.0;   ///< Rotation applied by deskew, in degrees
};

/**
 * @brief Grayscale, deskew, binarize and denoise pages before OCR
 *
 * A filter that fails on a particular image is logged and skipped; the
 * remaining filters still run.
 */
class ImagePreprocessor {
public:
  ImagePreprocessor();
  explicit ImagePreprocessor(const PreprocessingConfig &config);

  /**
   * @brief Run the configured filter chain
   * @param image Decoded page (1, 3 or 4 channels, 8-bit)
   * @return PreprocessResult containing the processed image
   */
  PreprocessResult process(const RasterImage &image) const;

  /**
   * @brief Estimate the skew of text in a grayscale image
   * @param gray Single-channel 8-bit image, dark text on light background
   * @param angle Receives the correcting rotation in degrees
   * @return false if there are too few foreground pixels to decide
   */
  static bool estimateSkew(const RasterImage &gray, double &angle);

private:
  RasterImage deskew(const RasterImage &image, const RasterImage &gray,
                     double &appliedAngle) const;
  bool binarize(const RasterImage &gray, RasterImage &out) const;
  bool removeNoise(const RasterImage &image, RasterImage &out) const;

  PreprocessingConfig m_config;
};

} // namespace ocrbatch

#endif // OCRBATCH_IMAGE_PREPROCESSOR_HPP
