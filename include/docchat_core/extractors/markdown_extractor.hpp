#pragma once

#include "text_extractor.hpp"

namespace docchat_core {

class MarkdownExtractor : public TextExtractor {
 public:
  bool can_handle(const fs::path& filename) const override;

  std::string extract(const std::string& bytes) const override;

 private:
  static std::string strip_front_matter(const std::string& content);
};

}  // namespace docchat_core
