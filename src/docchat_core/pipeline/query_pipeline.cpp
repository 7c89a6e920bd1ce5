#include "docchat_core/pipeline/query_pipeline.hpp"

#include <iostream>

#include "docchat_core/errors.hpp"
#include "docchat_core/llm/embedding_gateway.hpp"
#include "docchat_core/llm/model_services.hpp"
#include "docchat_core/retrieval/context_assembler.hpp"
#include "docchat_core/retrieval/retriever.hpp"

namespace docchat_core {

QueryPipeline::QueryPipeline(std::shared_ptr<EmbeddingGateway> gateway,
                             std::shared_ptr<Retriever> retriever,
                             std::shared_ptr<Generator> generator,
                             const PipelineConfig& config)
    : gateway_(std::move(gateway)),
      retriever_(std::move(retriever)),
      generator_(std::move(generator)),
      retrieval_k_(config.retrieval_k),
      score_threshold_(config.score_threshold),
      context_token_budget_(config.context_token_budget),
      embedding_retry_(RetryPolicy::for_embedding(config)),
      generation_retry_(RetryPolicy::for_generation(config)) {}

Turn QueryPipeline::failed_turn(const std::string& reason) {
  Turn turn;
  turn.role = TurnRole::ASSISTANT;
  turn.failure_reason = reason;
  return turn;
}

Turn QueryPipeline::run(const std::string& question, const CancellationToken& token) {
  // 1. Embed the question and retrieve
  RetrievalResult retrieval;
  try {
    std::vector<float> query_vector = embedding_retry_.run<ModelUnavailableError>(
        [&]() { return gateway_->embed_query(question, token); }, token, "query embedding");
    token.throw_if_cancelled("retrieval");
    retrieval = retriever_->retrieve(query_vector, retrieval_k_, score_threshold_);
  } catch (const ModelUnavailableError& e) {
    std::cerr << "QueryPipeline: query embedding failed: " << e.what() << std::endl;
    return failed_turn("ModelUnavailable");
  } catch (const DimensionMismatchError& e) {
    std::cerr << "QueryPipeline: query embedding failed: " << e.what() << std::endl;
    return failed_turn("DimensionMismatch");
  } catch (const OperationCancelledError&) {
    throw;
  } catch (const std::exception& e) {
    // Index or document store errors still leave a failed turn behind.
    std::cerr << "QueryPipeline: retrieval failed: " << e.what() << std::endl;
    return failed_turn("RetrievalFailed");
  }
  if (!retrieval.missing_chunk_ids.empty()) {
    std::cerr << "QueryPipeline: " << retrieval.missing_chunk_ids.size()
              << " retrieved chunk(s) had no stored record" << std::endl;
  }

  // 2. Assemble the context and prompt
  AssembledContext context = ContextAssembler::assemble(retrieval.chunks, context_token_budget_);
  const std::string prompt = ContextAssembler::build_prompt(question, context);

  // 3. Generate
  std::string answer;
  try {
    answer = generation_retry_.run<GenerationError>(
        [&]() { return generator_->generate(prompt); }, token, "answer generation");
  } catch (const GenerationError& e) {
    std::cerr << "QueryPipeline: " << e.what() << std::endl;
    return failed_turn(to_string(e.kind()));
  } catch (const OperationCancelledError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "QueryPipeline: answer generation failed: " << e.what() << std::endl;
    return failed_turn(to_string(GenerationErrorKind::Unavailable));
  }
  // A late answer to a cancelled question is dropped.
  token.throw_if_cancelled("answer generation");

  Turn turn;
  turn.role = TurnRole::ASSISTANT;
  turn.text = std::move(answer);
  turn.citations = std::move(context.citations);
  return turn;
}

}  // namespace docchat_core
