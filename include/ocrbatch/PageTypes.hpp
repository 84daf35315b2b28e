#ifndef OCRBATCH_PAGE_TYPES_HPP
#define OCRBATCH_PAGE_TYPES_HPP

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <variant>

namespace ocrbatch {

/**
 * @brief Decoded, in-memory pixel buffer for one page or image
 *
 * Always owns its pixels (never a view into a decoder or renderer buffer).
 * Width, height and channel count are cols, rows and channels().
 */
using RasterImage = cv::Mat;

/**
 * @brief Where a page came from
 */
enum class SourceKind {
  Image,  ///< Standalone image file, always page 1
  PdfPage ///< One page of a PDF document
};

/**
 * @brief Identifies one unit of work; created on discovery, never mutated
 */
struct PageDescriptor {
  std::string inputRootName;    ///< Base name of the scanned root directory
  std::string relativePath;     ///< Path relative to the root, '/' separated
  std::string originalFilename; ///< Base name of the source file
  std::string sourcePath;       ///< Absolute path on disk (diagnostic only)
  SourceKind sourceKind = SourceKind::Image; ///< Image or PDF page
  int pageNumber = 1;                        ///< 1-based page number
};

bool operator==(const PageDescriptor &lhs, const PageDescriptor &rhs);
bool operator!=(const PageDescriptor &lhs, const PageDescriptor &rhs);

/**
 * @brief Kinds of failure the page stream can report
 */
enum class PageErrorKind {
  ScanError,         ///< Directory enumeration broke
  DecodeError,       ///< Image file unreadable or corrupt
  PdfInfoError,      ///< Page count probe failed or reported zero pages
  PdfPageRenderError ///< A single PDF page failed to render
};

/**
 * @brief A successfully decoded page
 */
struct PageOk {
  PageDescriptor descriptor;
  RasterImage image;
};

/**
 * @brief A page, file or scan-level failure
 *
 * A failure without a descriptor is a scan-level failure (a directory could
 * not be listed) rather than a specific page.
 */
struct PageFailure {
  std::optional<PageDescriptor> descriptor;
  PageErrorKind kind = PageErrorKind::ScanError;
  std::string message;
};

/**
 * @brief Element of the page stream: either PageOk or PageFailure
 */
using PageItem = std::variant<PageOk, PageFailure>;

/// Serialized name of a source kind ("image" / "pdf_page")
std::string sourceKindName(SourceKind kind);

/// Human-readable name of an error kind
std::string errorKindName(PageErrorKind kind);

/// Log prefix of the form "[file.pdf | Page 3]"
std::string logPrefix(const PageDescriptor &descriptor);

} // namespace ocrbatch

#endif // OCRBATCH_PAGE_TYPES_HPP
