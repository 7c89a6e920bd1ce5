#pragma once

#include <string>
#include <vector>

#include "docchat_core/retrieval/retriever.hpp"
#include "docchat_core/types/conversation.hpp"

namespace docchat_core {

struct AssembledContext {
  // "[1] first passage\n\n[2] second passage"
  std::string context;
  // Inclusion order; citation n carries marker n
  std::vector<Citation> citations;
  size_t estimated_tokens = 0;
};

/**
 * @class ContextAssembler
 * @brief Packs ranked chunks into a bounded, citation-numbered context.
 *
 * Chunks are taken in relevance order. A chunk whose text already appears
 * inside an included chunk of the same document is skipped. Packing stops at
 * the first chunk that would push the estimated token count of the whole
 * context past the budget.
 */
class ContextAssembler {
 public:
  static AssembledContext assemble(const std::vector<RetrievedChunk>& ranked_chunks,
                                   size_t token_budget);

  static std::string build_prompt(const std::string& question, const AssembledContext& context);
};

}  // namespace docchat_core
