#include "ocrbatch/TextCleaner.hpp"

#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace ocrbatch {

namespace {

// UTF-8 encoding of U+FFFD
const std::string kReplacementCharacter = "\xEF\xBF\xBD";

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

std::string normalizeLine(const std::string &line) {
  std::string out;
  out.reserve(line.size());

  bool pendingSpace = false;
  for (char c : line) {
    if (isSpace(c)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out += ' ';
      pendingSpace = false;
    }
    out += c;
  }
  return out;
}

} // namespace

std::string cleanText(const std::string &rawText) {
  spdlog::debug("Cleaning text (original length: {})", rawText.size());

  std::string text = rawText;
  for (size_t pos = text.find(kReplacementCharacter); pos != std::string::npos;
       pos = text.find(kReplacementCharacter, pos)) {
    text.erase(pos, kReplacementCharacter.size());
  }

  // Split on \n, \r\n and \r
  std::vector<std::string> lines;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r' || c == '\n') {
      lines.push_back(current);
      current.clear();
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      current += c;
    }
  }
  lines.push_back(current);

  std::ostringstream joined;
  bool first = true;
  for (const std::string &line : lines) {
    std::string normalized = normalizeLine(line);
    if (normalized.empty()) {
      continue;
    }
    if (!first) {
      joined << '\n';
    }
    joined << normalized;
    first = false;
  }

  // Empty lines are already gone, so no run of newlines longer than one
  // survives the join
  std::string cleaned = joined.str();

  size_t begin = cleaned.find_first_not_of(" \t\n");
  size_t end = cleaned.find_last_not_of(" \t\n");
  cleaned = begin == std::string::npos ? std::string()
                                       : cleaned.substr(begin, end - begin + 1);

  spdlog::debug("Text cleaned. Final length: {} (removed {} characters)",
                cleaned.size(), rawText.size() - cleaned.size());
  return cleaned;
}

} // namespace ocrbatch
