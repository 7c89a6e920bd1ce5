#pragma once

#include "text_extractor.hpp"

namespace docchat_core {

class PlainTextExtractor : public TextExtractor {
 public:
  bool can_handle(const fs::path& filename) const override;

  std::string extract(const std::string& bytes) const override;
};

}  // namespace docchat_core
