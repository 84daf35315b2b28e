#ifndef OCRBATCH_PAGE_RASTERIZER_HPP
#define OCRBATCH_PAGE_RASTERIZER_HPP

#include "ocrbatch/PageTypes.hpp"

#include <string>
#include <vector>

namespace ocrbatch {

/**
 * @brief Result of a PDF page count probe
 */
struct PageCountResult {
  bool success = false;     ///< Whether the probe succeeded
  std::string errorMessage; ///< Error message if failed
  int pageCount = 0;        ///< Total number of pages in the document
};

/**
 * @brief Result of decoding an image file
 */
struct DecodeResult {
  bool success = false;     ///< Whether decoding succeeded
  std::string errorMessage; ///< Error message if failed
  RasterImage image;        ///< Fully decoded pixels
};

/**
 * @brief Request to rasterize a contiguous range of PDF pages
 *
 * The page stream only ever asks for a single page
 * (firstPage == lastPage), which bounds peak memory to one page.
 */
struct RenderRequest {
  std::string pdfPath; ///< Path to the PDF file
  int dpi = 300;       ///< Resolution in dots per inch
  int firstPage = 1;   ///< First page to render (1-indexed, inclusive)
  int lastPage = 1;    ///< Last page to render (1-indexed, inclusive)
};

/**
 * @brief Result of rendering PDF pages
 */
struct RenderResult {
  bool success = false;            ///< Whether rendering succeeded
  std::string errorMessage;        ///< Error message if failed
  std::vector<RasterImage> pages;  ///< One image per requested page
  double processingTimeMs = 0;     ///< Processing time in milliseconds
};

/**
 * @brief Backend that turns files on disk into raster images
 *
 * Implementations report failures through the result structs. The page
 * stream additionally converts any std::exception thrown by an
 * implementation into a failed item, so a misbehaving backend can never
 * terminate a scan.
 */
class PageRasterizer {
public:
  virtual ~PageRasterizer() = default;

  /**
   * @brief Query the number of pages in a PDF without rendering it
   * @param pdfPath Path to the PDF file
   * @return PageCountResult with the page count or an error message
   */
  virtual PageCountResult pdfPageCount(const std::string &pdfPath) = 0;

  /**
   * @brief Rasterize the requested page range of a PDF
   * @param request File, resolution and page range
   * @return RenderResult with one image per page or an error message
   */
  virtual RenderResult renderPdfPages(const RenderRequest &request) = 0;

  /**
   * @brief Decode an image file fully into memory
   * @param imagePath Path to the image file
   * @return DecodeResult with the decoded image or an error message
   */
  virtual DecodeResult decodeImage(const std::string &imagePath) = 0;
};

/**
 * @brief Rendering options for the Poppler backend
 */
struct RasterizerConfig {
  bool antialiasing = true;     ///< Antialias vector graphics
  bool textAntialiasing = true; ///< Antialias text
  std::string pdfPassword;      ///< User password tried on locked PDFs
};

/**
 * @brief PageRasterizer backed by Poppler (PDF) and OpenCV (images)
 *
 * Every call opens the document afresh and releases it before returning,
 * so no document state outlives a single page.
 *
 * Example usage:
 * @code
 * ocrbatch::PopplerRasterizer rasterizer;
 * auto count = rasterizer.pdfPageCount("report.pdf");
 * if (count.success) {
 *     auto page = rasterizer.renderPdfPages({"report.pdf", 300, 1, 1});
 * }
 * @endcode
 */
class PopplerRasterizer : public PageRasterizer {
public:
  PopplerRasterizer();
  explicit PopplerRasterizer(const RasterizerConfig &config);

  PageCountResult pdfPageCount(const std::string &pdfPath) override;
  RenderResult renderPdfPages(const RenderRequest &request) override;
  DecodeResult decodeImage(const std::string &imagePath) override;

  /**
   * @brief Route Poppler's diagnostic output into the application log
   *
   * Process-wide; call once before the first scan starts.
   */
  static void installPopplerLogHandler();

private:
  RasterizerConfig m_config;
};

} // namespace ocrbatch

#endif // OCRBATCH_PAGE_RASTERIZER_HPP
