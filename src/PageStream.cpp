#include "ocrbatch/PageStream.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace ocrbatch {

PageStream::iterator::iterator(PageStream *stream) : m_stream(stream) {
  ++*this;
}

PageStream::iterator &PageStream::iterator::operator++() {
  if (m_stream == nullptr) {
    return *this;
  }
  // Drop the previous page before the next one is rendered
  m_current.reset();
  m_current = m_stream->next();
  if (!m_current) {
    m_stream = nullptr;
  }
  return *this;
}

PageStream::PageStream(const std::string &rootPath, const ScanConfig &config,
                       std::shared_ptr<PageRasterizer> rasterizer)
    : m_scanner(rootPath, config), m_config(config),
      m_rasterizer(std::move(rasterizer)), m_state(State::NotStarted),
      m_iterating(false) {
  if (!m_rasterizer) {
    throw std::invalid_argument("PageStream requires a rasterizer");
  }
  if (m_config.pdfDpi <= 0) {
    throw std::invalid_argument("PDF DPI must be a positive integer, got " +
                                std::to_string(m_config.pdfDpi));
  }
}

PageStream::iterator PageStream::begin() {
  if (m_iterating) {
    throw std::logic_error("PageStream can only be iterated once");
  }
  m_iterating = true;
  return iterator(this);
}

PageStream::iterator PageStream::end() { return iterator(); }

bool PageStream::finished() const { return m_state == State::Finished; }

const StreamStatistics &PageStream::statistics() const { return m_statistics; }

std::optional<PageItem> PageStream::next() {
  while (m_state != State::Finished) {
    if (m_state == State::NotStarted) {
      startScan();
      continue;
    }

    if (m_state == State::InPdf) {
      if (m_pdf->nextPage > m_pdf->totalPages) {
        m_pdf.reset();
        m_state = State::Walking;
        continue;
      }
      return record(renderNextPdfPage());
    }

    std::optional<ScanEvent> event = m_scanner.next();
    if (!event) {
      finish();
      return std::nullopt;
    }

    if (const auto *listing = std::get_if<ListingFailure>(&*event)) {
      std::string message = "Failed to list directory " + listing->directory +
                            ": " + listing->message;
      spdlog::error("[Unknown Item] {}", message);
      return record(
          PageFailure{std::nullopt, PageErrorKind::ScanError, message});
    }

    const DocumentEntry &document = std::get<DocumentEntry>(*event);
    if (document.kind == DocumentKind::Image) {
      spdlog::debug("Found image: '{}'", document.relativePath);
      return record(decodeImageItem(document));
    }

    spdlog::debug("Found PDF: '{}'", document.relativePath);
    std::optional<PageItem> failure = probePdf(document);
    if (failure) {
      return record(std::move(*failure));
    }
  }

  return std::nullopt;
}

void PageStream::startScan() {
  spdlog::info("Scanning directory: {}", m_scanner.rootPath());
  spdlog::debug("Base directory name for metadata: '{}'",
                m_scanner.rootName());
  spdlog::debug("PDF conversion DPI: {}", m_config.pdfDpi);

  if (!m_scanner.open()) {
    spdlog::error("{}", m_scanner.errorMessage());
    finish();
    return;
  }
  m_state = State::Walking;
}

std::optional<PageItem> PageStream::probePdf(const DocumentEntry &document) {
  PageDescriptor descriptor =
      makeDescriptor(document, SourceKind::PdfPage, 1);

  std::string errorMessage;
  int totalPages = 0;
  try {
    PageCountResult count = m_rasterizer->pdfPageCount(document.sourcePath);
    if (!count.success) {
      errorMessage = count.errorMessage;
    } else if (count.pageCount < 1) {
      errorMessage = "PDF has no pages";
    } else {
      totalPages = count.pageCount;
    }
  } catch (const std::exception &e) {
    errorMessage = std::string("PDF page count failed: ") + e.what();
  }

  if (totalPages < 1) {
    spdlog::error("Error processing PDF '{}': {}", document.relativePath,
                  errorMessage);
    return PageItem{PageFailure{std::move(descriptor),
                                PageErrorKind::PdfInfoError, errorMessage}};
  }

  spdlog::info("Processing PDF: '{}' (Pages: {})", document.relativePath,
               totalPages);
  m_pdf = PdfCursor{document, totalPages, 1};
  m_state = State::InPdf;
  return std::nullopt;
}

PageItem PageStream::renderNextPdfPage() {
  int pageNumber = m_pdf->nextPage++;
  PageDescriptor descriptor =
      makeDescriptor(m_pdf->document, SourceKind::PdfPage, pageNumber);

  RenderRequest request;
  request.pdfPath = m_pdf->document.sourcePath;
  request.dpi = m_config.pdfDpi;
  request.firstPage = pageNumber;
  request.lastPage = pageNumber;

  std::string errorMessage;
  try {
    RenderResult result = m_rasterizer->renderPdfPages(request);
    if (!result.success) {
      errorMessage = result.errorMessage;
    } else if (result.pages.size() != 1 || result.pages.front().empty()) {
      errorMessage = "Renderer returned " +
                     std::to_string(result.pages.size()) +
                     " images for a single page";
    } else {
      spdlog::debug("{} Rendered '{}' at {} DPI ({}x{}) in {:.1f} ms",
                    logPrefix(descriptor), descriptor.relativePath,
                    request.dpi, result.pages.front().cols,
                    result.pages.front().rows, result.processingTimeMs);
      return PageOk{std::move(descriptor), std::move(result.pages.front())};
    }
  } catch (const std::exception &e) {
    errorMessage = std::string("PDF rendering failed: ") + e.what();
  }

  spdlog::error("{} Failed to render page of '{}': {}", logPrefix(descriptor),
                descriptor.relativePath, errorMessage);
  return PageFailure{std::move(descriptor), PageErrorKind::PdfPageRenderError,
                     errorMessage};
}

PageItem PageStream::decodeImageItem(const DocumentEntry &document) {
  PageDescriptor descriptor = makeDescriptor(document, SourceKind::Image, 1);

  std::string errorMessage;
  try {
    DecodeResult result = m_rasterizer->decodeImage(document.sourcePath);
    if (!result.success) {
      errorMessage = result.errorMessage;
    } else if (result.image.empty()) {
      errorMessage = "Decoder returned an empty image";
    } else {
      return PageOk{std::move(descriptor), std::move(result.image)};
    }
  } catch (const std::exception &e) {
    errorMessage = std::string("Image decode failed: ") + e.what();
  }

  spdlog::error("Error reading image '{}': {}", document.relativePath,
                errorMessage);
  return PageFailure{std::move(descriptor), PageErrorKind::DecodeError,
                     errorMessage};
}

PageDescriptor PageStream::makeDescriptor(const DocumentEntry &document,
                                          SourceKind kind,
                                          int pageNumber) const {
  PageDescriptor descriptor;
  descriptor.inputRootName = m_scanner.rootName();
  descriptor.relativePath = document.relativePath;
  descriptor.originalFilename = document.filename;
  descriptor.sourcePath = document.sourcePath;
  descriptor.sourceKind = kind;
  descriptor.pageNumber = pageNumber;
  return descriptor;
}

PageItem PageStream::record(PageItem item) {
  ++m_statistics.itemsYielded;
  m_statistics.documentsFound = m_scanner.documentsFound();
  if (std::holds_alternative<PageOk>(item)) {
    ++m_statistics.okItems;
  } else {
    ++m_statistics.failedItems;
  }
  return item;
}

void PageStream::finish() {
  m_state = State::Finished;
  m_pdf.reset();
  m_statistics.documentsFound = m_scanner.documentsFound();
  spdlog::info("Scan complete. Supported files found: {}. Items yielded: {} "
               "({} ok, {} failed)",
               m_statistics.documentsFound, m_statistics.itemsYielded,
               m_statistics.okItems, m_statistics.failedItems);
}

PageStream scan(const std::string &rootPath, const ScanConfig &config,
                std::shared_ptr<PageRasterizer> rasterizer) {
  return PageStream(rootPath, config, std::move(rasterizer));
}

} // namespace ocrbatch
