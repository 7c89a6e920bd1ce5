#include "docchat_core/retrieval/context_assembler.hpp"

#include <sstream>

#include "docchat_core/chunking/chunker.hpp"

namespace docchat_core {

namespace {

constexpr const char* PASSAGE_SEPARATOR = "\n\n";

bool is_redundant(const RetrievedChunk& candidate, const std::vector<const Chunk*>& included) {
  for (const Chunk* chunk : included) {
    if (chunk->document_id == candidate.chunk.document_id &&
        chunk->text.find(candidate.chunk.text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

AssembledContext ContextAssembler::assemble(const std::vector<RetrievedChunk>& ranked_chunks,
                                            size_t token_budget) {
  AssembledContext assembled;
  std::vector<const Chunk*> included;

  for (const auto& candidate : ranked_chunks) {
    if (is_redundant(candidate, included)) {
      continue;
    }

    const int marker = static_cast<int>(assembled.citations.size()) + 1;
    std::string next = assembled.context;
    if (!next.empty()) {
      next += PASSAGE_SEPARATOR;
    }
    next += "[" + std::to_string(marker) + "] " + candidate.chunk.text;

    const size_t tokens = estimate_tokens(next);
    if (tokens > token_budget) {
      break;
    }

    assembled.context = std::move(next);
    assembled.estimated_tokens = tokens;
    assembled.citations.push_back(
        Citation{marker, candidate.chunk.document_id, candidate.chunk.id, candidate.score});
    included.push_back(&candidate.chunk);
  }
  return assembled;
}

std::string ContextAssembler::build_prompt(const std::string& question,
                                           const AssembledContext& context) {
  std::ostringstream oss;
  oss << "Answer the question based only on the context. Cite the passages you use by their "
         "bracketed numbers, for example [1].\n\nContext:\n";
  if (context.context.empty()) {
    oss << "(no relevant passages were found)";
  } else {
    oss << context.context;
  }
  oss << "\n\nQuestion:\n"
      << question
      << "\n\nIf the context does not contain the answer, say that you do not know.";
  return oss.str();
}

}  // namespace docchat_core
