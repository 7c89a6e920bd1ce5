#include "docchat_core/extractors/markdown_extractor.hpp"

#include <algorithm>
#include <regex>

#include "docchat_core/errors.hpp"

namespace docchat_core {

bool MarkdownExtractor::can_handle(const fs::path& filename) const {
  const std::string extension = filename.extension().string();
  return extension == ".md" || extension == ".markdown";
}

// A YAML block opened by "---" on the very first line and closed by the next "---" line.
std::string MarkdownExtractor::strip_front_matter(const std::string& content) {
  if (content.rfind("---\n", 0) != 0) {
    return content;
  }
  const size_t close = content.find("\n---", 3);
  if (close == std::string::npos) {
    return content;
  }
  size_t body_start = close + 4;
  if (body_start < content.size() && content[body_start] == '\n') {
    ++body_start;
  }
  return content.substr(body_start);
}

/**
 * @brief Extracts the prose of a Markdown document.
 *
 * Front matter and HTML comments carry no answerable content and are dropped;
 * runs of three or more newlines are collapsed to a single blank line so that
 * the sliding-window chunker does not spend budget on whitespace. Headings and
 * inline markup are kept as-is.
 */
std::string MarkdownExtractor::extract(const std::string& bytes) const {
  if (std::find(bytes.begin(), bytes.end(), '\0') != bytes.end()) {
    throw ExtractionFailedError("content looks binary (contains NUL bytes)");
  }

  std::string content = strip_front_matter(normalize_text(bytes));

  const std::regex comment_regex(R"(<!--[\s\S]*?-->)");
  content = std::regex_replace(content, comment_regex, "");

  const std::regex blank_run_regex(R"(\n{3,})");
  content = std::regex_replace(content, blank_run_regex, "\n\n");

  return content;
}

}  // namespace docchat_core
