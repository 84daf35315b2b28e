#include "ocrbatch/DocumentScanner.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ocrbatch {

namespace {

const std::set<std::string> kImageExtensions = {".jpg",  ".jpeg", ".png",
                                                ".bmp",  ".tiff", ".tif"};
const std::set<std::string> kDocumentExtensions = {".pdf"};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

DocumentKind classifyExtension(const std::string &extension) {
  std::string lower = toLower(extension);
  if (kImageExtensions.count(lower) > 0) {
    return DocumentKind::Image;
  }
  if (kDocumentExtensions.count(lower) > 0) {
    return DocumentKind::Pdf;
  }
  return DocumentKind::Unsupported;
}

DocumentKind classifyPath(const fs::path &path) {
  return classifyExtension(path.extension().string());
}

std::string relativeDocumentPath(const fs::path &path, const fs::path &root,
                                 bool &fellBack) {
  fs::path relative = path.lexically_relative(root);
  std::string relativeString = relative.generic_string();
  fellBack = relativeString.empty() || relative.is_absolute() ||
             *relative.begin() == fs::path("..");
  if (fellBack) {
    spdlog::warn("Could not compute relative path for {} from {}; using "
                 "file name",
                 path.string(), root.string());
    return path.filename().string();
  }
  return relativeString;
}

DocumentScanner::DocumentScanner(const std::string &rootPath,
                                 const ScanConfig &config)
    : m_config(config), m_documentsFound(0) {
  std::error_code ec;
  fs::path root = fs::absolute(fs::path(rootPath), ec);
  if (ec) {
    root = fs::path(rootPath);
  }
  root = root.lexically_normal();

  // Drop a trailing separator so the root's base name is its last component
  if (root.filename().empty() && root.has_parent_path() &&
      root != root.root_path()) {
    root = root.parent_path();
  }

  m_root = root;
  m_rootPath = root.string();
  m_rootName = root.filename().string();
}

bool DocumentScanner::open() {
  std::error_code ec;
  if (!fs::exists(m_root, ec)) {
    m_errorMessage = "Input directory not found: " + m_rootPath;
    return false;
  }
  if (!fs::is_directory(m_root, ec)) {
    m_errorMessage = "Input path is not a directory: " + m_rootPath;
    return false;
  }

  m_stack.clear();
  m_visited.clear();
  m_documentsFound = 0;

  std::string error;
  if (pushDirectory(m_root, error) != PushOutcome::Pushed) {
    m_errorMessage = "Failed to list input directory " + m_rootPath + ": " +
                     (error.empty() ? std::string("unknown error") : error);
    return false;
  }
  return true;
}

std::optional<ScanEvent> DocumentScanner::next() {
  while (!m_stack.empty()) {
    DirectoryFrame &frame = m_stack.back();
    if (frame.position >= frame.entries.size()) {
      m_stack.pop_back();
      continue;
    }

    const fs::directory_entry entry = frame.entries[frame.position++];
    const fs::path &path = entry.path();
    std::error_code ec;

    if (entry.is_directory(ec)) {
      if (entry.is_symlink(ec) && !m_config.followSymlinks) {
        spdlog::debug("Skipping symlinked directory: {}", path.string());
        continue;
      }

      std::string error;
      PushOutcome outcome = pushDirectory(path, error);
      if (outcome == PushOutcome::Failed) {
        return ScanEvent{ListingFailure{path.string(), error}};
      }
      if (outcome == PushOutcome::AlreadyVisited) {
        spdlog::warn("Directory already visited in this scan, skipping: {}",
                     path.string());
      }
      continue;
    }

    // Sockets, devices and dangling links are never documents
    if (!entry.is_regular_file(ec)) {
      continue;
    }

    DocumentKind kind = classifyPath(path);
    if (kind == DocumentKind::Unsupported) {
      spdlog::trace("Skipping unsupported file: {}", path.string());
      continue;
    }

    ++m_documentsFound;
    return ScanEvent{makeEntry(path, kind)};
  }

  return std::nullopt;
}

const std::string &DocumentScanner::rootPath() const { return m_rootPath; }

const std::string &DocumentScanner::rootName() const { return m_rootName; }

const std::string &DocumentScanner::errorMessage() const {
  return m_errorMessage;
}

int DocumentScanner::documentsFound() const { return m_documentsFound; }

DocumentScanner::PushOutcome
DocumentScanner::pushDirectory(const fs::path &directory,
                               std::string &errorMessage) {
  std::error_code ec;
  fs::path canonical = fs::canonical(directory, ec);
  std::string key = ec ? directory.lexically_normal().string()
                       : canonical.string();
  if (!m_visited.insert(key).second) {
    return PushOutcome::AlreadyVisited;
  }

  DirectoryFrame frame;
  frame.path = directory;

  ec.clear();
  fs::directory_iterator it(directory, ec);
  fs::directory_iterator end;
  while (!ec && it != end) {
    frame.entries.push_back(*it);
    it.increment(ec);
  }
  if (ec) {
    errorMessage = ec.message();
    return PushOutcome::Failed;
  }

  if (m_config.sortEntries) {
    std::sort(frame.entries.begin(), frame.entries.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.path().filename().string() <
                       b.path().filename().string();
              });
  }

  m_stack.push_back(std::move(frame));
  return PushOutcome::Pushed;
}

DocumentEntry DocumentScanner::makeEntry(const fs::path &path,
                                         DocumentKind kind) const {
  DocumentEntry entry;
  entry.sourcePath = path.string();
  entry.filename = path.filename().string();
  entry.kind = kind;

  entry.relativePath =
      relativeDocumentPath(path, m_root, entry.relativePathFallback);
  return entry;
}

} // namespace ocrbatch
