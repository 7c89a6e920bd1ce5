#pragma once

#include <string>
#include <vector>

#include "docchat_core/llm/model_services.hpp"

namespace docchat_core {

// Embedding and generation over a local Ollama server.
class OllamaClient : public Embedder, public Generator {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int timeout_seconds = 120);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  // Embeds the whole batch in a single request.
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  std::string generate(const std::string &prompt) override;

  bool is_server_available() override;

  /**
   * @brief Reads the vectors out of an /api/embed response body.
   * @throw ModelUnavailableError if the body is not a well-formed embeddings response.
   */
  static std::vector<std::vector<float>> parse_embeddings_response(const std::string &body);

  const std::string &embedding_model() const {
    return embedding_model_;
  }
  const std::string &generation_model() const {
    return generation_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  int timeout_seconds_;

  void setup_server_connection();
};

}  // namespace docchat_core
