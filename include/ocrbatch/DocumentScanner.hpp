#ifndef OCRBATCH_DOCUMENT_SCANNER_HPP
#define OCRBATCH_DOCUMENT_SCANNER_HPP

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace ocrbatch {

/**
 * @brief Classification of a file found during a scan
 */
enum class DocumentKind {
  Image,      ///< .jpg .jpeg .png .bmp .tiff .tif
  Pdf,        ///< .pdf
  Unsupported ///< Anything else; skipped silently
};

/**
 * @brief Classify a file extension (with leading dot), case-insensitive
 */
DocumentKind classifyExtension(const std::string &extension);

/**
 * @brief Classify a path by its extension
 */
DocumentKind classifyPath(const std::filesystem::path &path);

/**
 * @brief Path of @p path below @p root, '/' separated
 *
 * When @p path does not lie under @p root the bare file name is returned,
 * a warning is logged and @p fellBack is set.
 */
std::string relativeDocumentPath(const std::filesystem::path &path,
                                 const std::filesystem::path &root,
                                 bool &fellBack);

/**
 * @brief Options controlling a directory scan
 */
struct ScanConfig {
  int pdfDpi = 300;            ///< Resolution for PDF page rendering
  bool sortEntries = true;     ///< Visit each directory's entries by name
  bool followSymlinks = false; ///< Descend into symlinked directories
};

/**
 * @brief A supported file discovered under the scan root
 */
struct DocumentEntry {
  std::string sourcePath;   ///< Absolute path to the file
  std::string relativePath; ///< Path relative to the root, '/' separated
  std::string filename;     ///< Base name of the file
  DocumentKind kind = DocumentKind::Unsupported;
  bool relativePathFallback = false; ///< relativePath is the bare filename
};

/**
 * @brief A directory below the root that could not be listed
 */
struct ListingFailure {
  std::string directory;
  std::string message;
};

using ScanEvent = std::variant<DocumentEntry, ListingFailure>;

/**
 * @brief Lazy depth-first walk over a directory tree
 *
 * Only one listing per directory level on the current path is held in
 * memory. Directories are never entered twice within one scan, which also
 * guards against symlink cycles when followSymlinks is enabled.
 */
class DocumentScanner {
public:
  /**
   * @brief Construct a scanner; nothing touches the filesystem until open()
   * @param rootPath Directory to scan
   * @param config Scan options
   */
  DocumentScanner(const std::string &rootPath, const ScanConfig &config);

  /**
   * @brief List the root directory
   * @return false if the root is missing, not a directory or unlistable
   */
  bool open();

  /**
   * @brief Advance to the next supported file or listing failure
   * @return The next event, or std::nullopt once the walk is complete
   */
  std::optional<ScanEvent> next();

  const std::string &rootPath() const;
  const std::string &rootName() const;
  const std::string &errorMessage() const;
  int documentsFound() const;

private:
  enum class PushOutcome { Pushed, AlreadyVisited, Failed };

  struct DirectoryFrame {
    std::filesystem::path path;
    std::vector<std::filesystem::directory_entry> entries;
    size_t position = 0;
  };

  PushOutcome pushDirectory(const std::filesystem::path &directory,
                            std::string &errorMessage);
  DocumentEntry makeEntry(const std::filesystem::path &path,
                          DocumentKind kind) const;

  std::filesystem::path m_root;
  std::string m_rootPath;
  std::string m_rootName;
  ScanConfig m_config;
  std::string m_errorMessage;
  std::vector<DirectoryFrame> m_stack;
  std::set<std::string> m_visited; ///< Canonical paths of entered directories
  int m_documentsFound;
};

} // namespace ocrbatch

#endif // OCRBATCH_DOCUMENT_SCANNER_HPP
