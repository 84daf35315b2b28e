#include "ocrbatch/PageTypes.hpp"

namespace ocrbatch {

bool operator==(const PageDescriptor &lhs, const PageDescriptor &rhs) {
  return lhs.inputRootName == rhs.inputRootName &&
         lhs.relativePath == rhs.relativePath &&
         lhs.originalFilename == rhs.originalFilename &&
         lhs.sourcePath == rhs.sourcePath &&
         lhs.sourceKind == rhs.sourceKind && lhs.pageNumber == rhs.pageNumber;
}

bool operator!=(const PageDescriptor &lhs, const PageDescriptor &rhs) {
  return !(lhs == rhs);
}

std::string sourceKindName(SourceKind kind) {
  switch (kind) {
  case SourceKind::Image:
    return "image";
  case SourceKind::PdfPage:
  default:
    return "pdf_page";
  }
}

std::string errorKindName(PageErrorKind kind) {
  switch (kind) {
  case PageErrorKind::ScanError:
    return "ScanError";
  case PageErrorKind::DecodeError:
    return "DecodeError";
  case PageErrorKind::PdfInfoError:
    return "PdfInfoError";
  case PageErrorKind::PdfPageRenderError:
  default:
    return "PdfPageRenderError";
  }
}

std::string logPrefix(const PageDescriptor &descriptor) {
  return "[" + descriptor.originalFilename + " | Page " +
         std::to_string(descriptor.pageNumber) + "]";
}

} // namespace ocrbatch
