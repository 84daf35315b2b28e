#include "ocrbatch/ImagePreprocessor.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <cmath>

using namespace ocrbatch;

namespace {

// White page with horizontal black bars standing in for lines of text
cv::Mat makeTextPage(int width = 400, int height = 300) {
  cv::Mat page(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
  for (int y = 40; y + 12 < height - 40; y += 40) {
    cv::rectangle(page, cv::Rect(40, y, width - 80, 12), cv::Scalar(0, 0, 0),
                  cv::FILLED);
  }
  return page;
}

cv::Mat rotate(const cv::Mat &image, double degrees) {
  cv::Point2f center(image.cols / 2.0f, image.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, degrees, 1.0);
  cv::Mat rotated;
  cv::warpAffine(image, rotated, rotation, image.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar::all(255));
  return rotated;
}

bool isBinary(const cv::Mat &image) {
  for (int y = 0; y < image.rows; ++y) {
    for (int x = 0; x < image.cols; ++x) {
      uchar value = image.at<uchar>(y, x);
      if (value != 0 && value != 255) {
        return false;
      }
    }
  }
  return true;
}

} // namespace

TEST(ImagePreprocessor, EmptyImageFails) {
  ImagePreprocessor preprocessor;
  PreprocessResult result = preprocessor.process(cv::Mat());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
}

TEST(ImagePreprocessor, DisabledReturnsBgrCopy) {
  cv::Mat gray(20, 30, CV_8UC1, cv::Scalar(128));
  ImagePreprocessor preprocessor;

  PreprocessResult result = preprocessor.process(gray);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(3, result.image.channels());
  EXPECT_EQ(30, result.image.cols);
  EXPECT_EQ(20, result.image.rows);
  EXPECT_EQ(128, result.image.at<cv::Vec3b>(5, 5)[1]);
}

TEST(ImagePreprocessor, DisabledDropsAlpha) {
  cv::Mat bgra(5, 5, CV_8UC4, cv::Scalar(1, 2, 3, 4));
  ImagePreprocessor preprocessor;

  PreprocessResult result = preprocessor.process(bgra);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(3, result.image.channels());
  EXPECT_EQ(cv::Vec3b(1, 2, 3), result.image.at<cv::Vec3b>(0, 0));
}

TEST(ImagePreprocessor, DisabledScalesUnitFloatImages) {
  cv::Mat unit(4, 4, CV_32FC1, cv::Scalar(1.0));
  ImagePreprocessor preprocessor;

  PreprocessResult result = preprocessor.process(unit);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(CV_8U, result.image.depth());
  EXPECT_EQ(255, result.image.at<cv::Vec3b>(0, 0)[0]);
}

TEST(ImagePreprocessor, GrayscaleProducesSingleChannel) {
  PreprocessingConfig config;
  config.enabled = true;
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(makeTextPage());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(1, result.image.channels());
}

TEST(ImagePreprocessor, EnabledWithoutFiltersKeepsColor) {
  PreprocessingConfig config;
  config.enabled = true;
  config.grayscale = false;
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(makeTextPage());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(3, result.image.channels());
}

TEST(ImagePreprocessor, OtsuBinarizationIsBlackAndWhite) {
  cv::Mat page = makeTextPage();
  cv::GaussianBlur(page, page, cv::Size(5, 5), 0);

  PreprocessingConfig config;
  config.enabled = true;
  config.binarizationMethod = "otsu";
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(page);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(1, result.image.channels());
  EXPECT_TRUE(isBinary(result.image));
  EXPECT_EQ(255, result.image.at<uchar>(5, 5));
  EXPECT_EQ(0, result.image.at<uchar>(46, 200));
}

TEST(ImagePreprocessor, AdaptiveBinarizationIsBlackAndWhite) {
  PreprocessingConfig config;
  config.enabled = true;
  config.binarizationMethod = "adaptive";
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(makeTextPage());
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(isBinary(result.image));
}

TEST(ImagePreprocessor, EvenAdaptiveBlockSizeSkipsBinarization) {
  cv::Mat page = makeTextPage();
  cv::GaussianBlur(page, page, cv::Size(5, 5), 0);

  PreprocessingConfig config;
  config.enabled = true;
  config.binarizationMethod = "adaptive";
  config.adaptiveBlockSize = 10;
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(page);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(1, result.image.channels());
  EXPECT_FALSE(isBinary(result.image));
}

TEST(ImagePreprocessor, UnknownMethodsAreSkipped) {
  PreprocessingConfig config;
  config.enabled = true;
  config.binarizationMethod = "sauvola";
  config.noiseRemoval = "gaussian_3";
  ImagePreprocessor preprocessor(config);

  cv::Mat page = makeTextPage();
  PreprocessResult result = preprocessor.process(page);
  ASSERT_TRUE(result.success);

  cv::Mat expected;
  cv::cvtColor(page, expected, cv::COLOR_BGR2GRAY);
  EXPECT_EQ(0, cv::countNonZero(result.image != expected));
}

TEST(ImagePreprocessor, MedianBlurRemovesSpeckles) {
  cv::Mat page(50, 50, CV_8UC3, cv::Scalar(255, 255, 255));
  page.at<cv::Vec3b>(25, 25) = cv::Vec3b(0, 0, 0);

  PreprocessingConfig config;
  config.enabled = true;
  config.noiseRemoval = "median_3";
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(page);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(255, result.image.at<uchar>(25, 25));
}

TEST(ImagePreprocessor, InvalidMedianKernelIsSkipped) {
  cv::Mat page(50, 50, CV_8UC3, cv::Scalar(255, 255, 255));
  page.at<cv::Vec3b>(25, 25) = cv::Vec3b(0, 0, 0);

  for (const char *method : {"median_4", "median_x", "median_"}) {
    PreprocessingConfig config;
    config.enabled = true;
    config.noiseRemoval = method;
    ImagePreprocessor preprocessor(config);

    PreprocessResult result = preprocessor.process(page);
    ASSERT_TRUE(result.success) << method;
    EXPECT_EQ(0, result.image.at<uchar>(25, 25)) << method;
  }
}

TEST(ImagePreprocessor, EstimatesSkewOfRotatedText) {
  cv::Mat gray;
  cv::cvtColor(rotate(makeTextPage(), 5.0), gray, cv::COLOR_BGR2GRAY);

  double angle = 0.0;
  ASSERT_TRUE(ImagePreprocessor::estimateSkew(gray, angle));
  EXPECT_NEAR(5.0, std::abs(angle), 1.0);
}

TEST(ImagePreprocessor, BlankPageHasNoSkewEstimate) {
  cv::Mat blank(100, 100, CV_8UC1, cv::Scalar(255));
  double angle = 0.0;
  EXPECT_FALSE(ImagePreprocessor::estimateSkew(blank, angle));
}

TEST(ImagePreprocessor, DeskewLeavesStraightPageAlone) {
  PreprocessingConfig config;
  config.enabled = true;
  config.deskew = true;
  ImagePreprocessor preprocessor(config);

  PreprocessResult result = preprocessor.process(makeTextPage());
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(0.0, result.skewAngle);
}

TEST(ImagePreprocessor, DeskewRotatesSkewedPage) {
  PreprocessingConfig config;
  config.enabled = true;
  config.deskew = true;
  ImagePreprocessor preprocessor(config);

  cv::Mat page = makeTextPage();
  PreprocessResult result = preprocessor.process(rotate(page, 5.0));
  ASSERT_TRUE(result.success);
  EXPECT_NEAR(5.0, std::abs(result.skewAngle), 1.0);
  EXPECT_EQ(page.cols, result.image.cols);
  EXPECT_EQ(page.rows, result.image.rows);

  // Rotating the wrong way would leave about twice the original skew
  cv::Mat gray = result.image;
  if (gray.channels() == 3) {
    cv::cvtColor(result.image, gray, cv::COLOR_BGR2GRAY);
  }
  double residual = 90.0;
  ASSERT_TRUE(ImagePreprocessor::estimateSkew(gray, residual));
  EXPECT_NEAR(0.0, residual, 1.0);
}
