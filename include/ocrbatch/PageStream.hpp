#ifndef OCRBATCH_PAGE_STREAM_HPP
#define OCRBATCH_PAGE_STREAM_HPP

#include "ocrbatch/DocumentScanner.hpp"
#include "ocrbatch/PageRasterizer.hpp"
#include "ocrbatch/PageTypes.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace ocrbatch {

/**
 * @brief Counters accumulated while a stream is consumed
 */
struct StreamStatistics {
  int documentsFound = 0; ///< Supported files discovered
  int itemsYielded = 0;   ///< Items of either kind handed to the consumer
  int okItems = 0;        ///< PageOk items
  int failedItems = 0;    ///< PageFailure items
};

/**
 * @brief One-pass, pull-based stream of PageItem over a directory tree
 *
 * The stream advances only when next() is called (or the iterator is
 * incremented). Images are decoded in one step; PDFs are probed for their
 * page count and then rendered one page per pull, so at most one page's
 * pixels are alive inside the stream at any time. Every per-file and
 * per-page error becomes a PageFailure item; only an inaccessible root
 * ends the stream early (with no items).
 *
 * The stream cannot be restarted. Call scan() again for a fresh walk.
 *
 * Example usage:
 * @code
 * auto rasterizer = std::make_shared<ocrbatch::PopplerRasterizer>();
 * ocrbatch::PageStream stream = ocrbatch::scan("input", {}, rasterizer);
 * for (ocrbatch::PageItem &item : stream) {
 *     if (auto *ok = std::get_if<ocrbatch::PageOk>(&item)) {
 *         process(ok->descriptor, std::move(ok->image));
 *     }
 * }
 * @endcode
 */
class PageStream {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = PageItem;
    using difference_type = std::ptrdiff_t;
    using pointer = PageItem *;
    using reference = PageItem &;

    iterator() = default;

    reference operator*() { return *m_current; }
    pointer operator->() { return &*m_current; }
    iterator &operator++();
    void operator++(int) { ++*this; }

    bool operator==(const iterator &other) const {
      return m_stream == other.m_stream;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    friend class PageStream;
    explicit iterator(PageStream *stream);

    PageStream *m_stream = nullptr;
    std::optional<PageItem> m_current;
  };

  /**
   * @brief Create a stream; no filesystem access happens until the first pull
   * @param rootPath Directory to scan
   * @param config Scan options (DPI, ordering, symlink policy)
   * @param rasterizer Backend used to decode images and render PDF pages
   */
  PageStream(const std::string &rootPath, const ScanConfig &config,
             std::shared_ptr<PageRasterizer> rasterizer);

  PageStream(const PageStream &) = delete;
  PageStream &operator=(const PageStream &) = delete;
  PageStream(PageStream &&) = default;
  PageStream &operator=(PageStream &&) = default;

  /**
   * @brief Produce the next item
   * @return The next item, or std::nullopt once the stream is exhausted
   */
  std::optional<PageItem> next();

  /**
   * @brief Begin iteration; may only be called once per stream
   */
  iterator begin();
  iterator end();

  bool finished() const;
  const StreamStatistics &statistics() const;

private:
  enum class State { NotStarted, Walking, InPdf, Finished };

  struct PdfCursor {
    DocumentEntry document;
    int totalPages = 0;
    int nextPage = 1;
  };

  void startScan();
  PageItem renderNextPdfPage();
  PageItem decodeImageItem(const DocumentEntry &document);
  std::optional<PageItem> probePdf(const DocumentEntry &document);
  PageDescriptor makeDescriptor(const DocumentEntry &document,
                                SourceKind kind, int pageNumber) const;
  PageItem record(PageItem item);
  void finish();

  DocumentScanner m_scanner;
  ScanConfig m_config;
  std::shared_ptr<PageRasterizer> m_rasterizer;
  State m_state;
  std::optional<PdfCursor> m_pdf;
  StreamStatistics m_statistics;
  bool m_iterating;
};

/**
 * @brief Start a fresh scan of rootPath
 *
 * Each call walks the filesystem again; consuming two streams from the same
 * unchanged directory yields equal results.
 */
PageStream scan(const std::string &rootPath, const ScanConfig &config,
                std::shared_ptr<PageRasterizer> rasterizer);

} // namespace ocrbatch

#endif // OCRBATCH_PAGE_STREAM_HPP
