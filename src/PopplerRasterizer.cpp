#include "ocrbatch/PageRasterizer.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace ocrbatch {

namespace {

std::unique_ptr<poppler::document> openDocument(const std::string &pdfPath,
                                                const RasterizerConfig &config,
                                                std::string &errorMessage) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(pdfPath, ec)) {
    errorMessage = "PDF file not found: " + pdfPath;
    return nullptr;
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(
      pdfPath, std::string(), config.pdfPassword));

  if (!doc) {
    errorMessage = "Failed to load PDF file: " + pdfPath;
    return nullptr;
  }

  if (doc->is_locked()) {
    errorMessage = "PDF file is password protected: " + pdfPath;
    return nullptr;
  }

  return doc;
}

// Copies the renderer's buffer; the poppler::image does not outlive the call.
bool toRasterImage(const poppler::image &popplerImage, RasterImage &out,
                   std::string &errorMessage) {
  int width = popplerImage.width();
  int height = popplerImage.height();

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory on little-endian hosts
    cv::Mat bgra(height, width, CV_8UC4,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(bgra, out, cv::COLOR_BGRA2BGR);
    return true;
  }
  case poppler::image::format_rgb24: {
    cv::Mat rgb(height, width, CV_8UC3,
                const_cast<char *>(popplerImage.const_data()),
                popplerImage.bytes_per_row());
    cv::cvtColor(rgb, out, cv::COLOR_RGB2BGR);
    return true;
  }
  case poppler::image::format_bgr24: {
    out = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    return true;
  }
  case poppler::image::format_gray8: {
    out = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    return true;
  }
  default:
    errorMessage = "Unsupported image format";
    return false;
  }
}

void logPopplerMessage(const std::string &message, void *) {
  spdlog::warn("poppler: {}", message);
}

} // namespace

PopplerRasterizer::PopplerRasterizer() : m_config() {}

PopplerRasterizer::PopplerRasterizer(const RasterizerConfig &config)
    : m_config(config) {}

void PopplerRasterizer::installPopplerLogHandler() {
  poppler::set_debug_error_function(&logPopplerMessage, nullptr);
}

PageCountResult PopplerRasterizer::pdfPageCount(const std::string &pdfPath) {
  PageCountResult result;

  try {
    std::unique_ptr<poppler::document> doc =
        openDocument(pdfPath, m_config, result.errorMessage);
    if (!doc) {
      return result;
    }

    result.pageCount = doc->pages();
    if (result.pageCount < 1) {
      result.errorMessage = "PDF has no pages";
      return result;
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page count failed: ") + e.what();
  }

  return result;
}

RenderResult PopplerRasterizer::renderPdfPages(const RenderRequest &request) {
  RenderResult result;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (request.dpi <= 0) {
    result.errorMessage = "DPI must be positive";
    return result;
  }
  if (request.firstPage < 1 || request.lastPage < request.firstPage) {
    result.errorMessage = "Invalid page range " +
                          std::to_string(request.firstPage) + "-" +
                          std::to_string(request.lastPage);
    return result;
  }

  try {
    std::unique_ptr<poppler::document> doc =
        openDocument(request.pdfPath, m_config, result.errorMessage);
    if (!doc) {
      return result;
    }

    int pageCount = doc->pages();
    if (request.lastPage > pageCount) {
      result.errorMessage = "Page " + std::to_string(request.lastPage) +
                            " out of range (document has " +
                            std::to_string(pageCount) + " pages)";
      return result;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing,
                             m_config.antialiasing);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing,
                             m_config.textAntialiasing);
    renderer.set_image_format(poppler::image::format_argb32);

    double dpi = static_cast<double>(request.dpi);
    for (int pageNumber = request.firstPage; pageNumber <= request.lastPage;
         ++pageNumber) {
      std::unique_ptr<poppler::page> page(doc->create_page(pageNumber - 1));
      if (!page) {
        result.errorMessage =
            "Failed to create page " + std::to_string(pageNumber);
        result.pages.clear();
        return result;
      }

      poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
      if (!popplerImage.is_valid()) {
        result.errorMessage =
            "Failed to render page " + std::to_string(pageNumber);
        result.pages.clear();
        return result;
      }

      RasterImage image;
      if (!toRasterImage(popplerImage, image, result.errorMessage)) {
        result.pages.clear();
        return result;
      }
      result.pages.push_back(std::move(image));
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF rendering failed: ") + e.what();
    result.pages.clear();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

DecodeResult PopplerRasterizer::decodeImage(const std::string &imagePath) {
  DecodeResult result;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(imagePath, ec)) {
    result.errorMessage = "Image file not found: " + imagePath;
    return result;
  }

  try {
    // imread decodes the whole file; there is no deferred loading
    result.image = cv::imread(imagePath, cv::IMREAD_COLOR);
    if (result.image.empty()) {
      result.errorMessage = "Failed to load image: " + imagePath;
      return result;
    }
    result.success = true;
  } catch (const cv::Exception &e) {
    result.errorMessage = std::string("Image decode failed: ") + e.what();
    result.image.release();
  }

  return result;
}

} // namespace ocrbatch
