#ifndef OCRBATCH_TEST_HELPERS_HPP
#define OCRBATCH_TEST_HELPERS_HPP

#include "ocrbatch/PageRasterizer.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ocrbatch {
namespace test {

/**
 * @brief Fixture owning a fresh temporary directory per test
 */
class TempDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    m_dir = std::filesystem::temp_directory_path() /
            ("ocrbatch_test_" + std::to_string(stamp) + "_" +
             std::to_string(counter++));
    std::filesystem::create_directories(m_dir);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::permissions(m_dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
    std::filesystem::remove_all(m_dir, ec);
  }

  const std::filesystem::path &dir() const { return m_dir; }

  std::filesystem::path writeFile(const std::string &relative,
                                  const std::string &content = "x") const {
    std::filesystem::path path = m_dir / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  std::filesystem::path makeDir(const std::string &relative) const {
    std::filesystem::path path = m_dir / relative;
    std::filesystem::create_directories(path);
    return path;
  }

  std::filesystem::path writePng(const std::string &relative, int width = 10,
                                 int height = 10) const {
    std::filesystem::path path = m_dir / relative;
    std::filesystem::create_directories(path.parent_path());
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::imwrite(path.string(), image);
    return path;
  }

private:
  std::filesystem::path m_dir;
};

/**
 * @brief Build a minimal valid PDF with blank pages of the given size
 *
 * Object offsets in the cross-reference table are computed while writing,
 * so the result opens without reconstruction.
 */
inline std::string makeBlankPdf(int pageCount, int widthPt = 72,
                                int heightPt = 72) {
  std::ostringstream pdf;
  std::vector<std::streamoff> offsets;

  pdf << "%PDF-1.4\n";

  offsets.push_back(pdf.tellp());
  pdf << "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

  offsets.push_back(pdf.tellp());
  pdf << "2 0 obj\n<< /Type /Pages /Kids [";
  for (int i = 0; i < pageCount; ++i) {
    pdf << (i == 0 ? "" : " ") << (3 + i) << " 0 R";
  }
  pdf << "] /Count " << pageCount << " >>\nendobj\n";

  for (int i = 0; i < pageCount; ++i) {
    offsets.push_back(pdf.tellp());
    pdf << (3 + i) << " 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "
        << widthPt << " " << heightPt << "] /Resources << >> >>\nendobj\n";
  }

  std::streamoff xref = pdf.tellp();
  int objectCount = static_cast<int>(offsets.size()) + 1;
  pdf << "xref\n0 " << objectCount << "\n";
  pdf << "0000000000 65535 f \n";
  for (std::streamoff offset : offsets) {
    char entry[21];
    std::snprintf(entry, sizeof(entry), "%010lld 00000 n \n",
                  static_cast<long long>(offset));
    pdf << entry;
  }
  pdf << "trailer\n<< /Size " << objectCount << " /Root 1 0 R >>\n"
      << "startxref\n"
      << xref << "\n%%EOF\n";
  return pdf.str();
}

/**
 * @brief Scriptable PageRasterizer that records every call
 *
 * Files are identified by their base name. PDFs report the page count
 * registered with setPageCount; unregistered PDFs fail the probe. Images
 * decode to a 10x10 white page unless registered with failDecode.
 */
class FakeRasterizer : public PageRasterizer {
public:
  void setPageCount(const std::string &filename, int pages) {
    m_pageCounts[filename] = pages;
  }
  void failPage(const std::string &filename, int page) {
    m_failingPages.insert({filename, page});
  }
  void throwOnPage(const std::string &filename, int page) {
    m_throwingPages.insert({filename, page});
  }
  void failDecode(const std::string &filename) {
    m_failingDecodes.insert(filename);
  }

  PageCountResult pdfPageCount(const std::string &pdfPath) override {
    std::string name = baseName(pdfPath);
    probes.push_back(name);

    PageCountResult result;
    auto it = m_pageCounts.find(name);
    if (it == m_pageCounts.end()) {
      result.errorMessage = "Syntax Error: Couldn't find trailer dictionary";
      return result;
    }
    result.pageCount = it->second;
    result.success = true;
    return result;
  }

  RenderResult renderPdfPages(const RenderRequest &request) override {
    std::string name = baseName(request.pdfPath);
    renders.push_back(request);

    // Any reference beyond m_lastPage means the caller still holds that page
    int live = 1;
    if (!m_lastPage.empty() && m_lastPage.u != nullptr &&
        m_lastPage.u->refcount > 1) {
      ++live;
    }
    maxLivePages = std::max(maxLivePages, live);

    RenderResult result;
    if (m_throwingPages.count({name, request.firstPage}) > 0) {
      throw std::runtime_error("renderer crashed");
    }
    if (m_failingPages.count({name, request.firstPage}) > 0) {
      result.errorMessage = "Failed to render page " +
                            std::to_string(request.firstPage);
      return result;
    }
    for (int page = request.firstPage; page <= request.lastPage; ++page) {
      // Encode the page number in the pixel value so tests can tell pages apart
      result.pages.emplace_back(4, 4, CV_8UC3, cv::Scalar::all(page));
    }
    if (!result.pages.empty()) {
      m_lastPage = result.pages.back();
    }
    result.success = true;
    return result;
  }

  DecodeResult decodeImage(const std::string &imagePath) override {
    std::string name = baseName(imagePath);
    decodes.push_back(name);

    DecodeResult result;
    if (m_failingDecodes.count(name) > 0) {
      result.errorMessage = "Failed to load image: " + imagePath;
      return result;
    }
    result.image = cv::Mat(10, 10, CV_8UC3, cv::Scalar(255, 255, 255));
    result.success = true;
    return result;
  }

  std::vector<std::string> probes;
  std::vector<RenderRequest> renders;
  std::vector<std::string> decodes;
  int maxLivePages = 0; ///< Most page buffers alive during one render call

private:
  static std::string baseName(const std::string &path) {
    return std::filesystem::path(path).filename().string();
  }

  std::map<std::string, int> m_pageCounts;
  std::set<std::pair<std::string, int>> m_failingPages;
  std::set<std::pair<std::string, int>> m_throwingPages;
  std::set<std::string> m_failingDecodes;
  cv::Mat m_lastPage;
};

} // namespace test
} // namespace ocrbatch

#endif // OCRBATCH_TEST_HELPERS_HPP
