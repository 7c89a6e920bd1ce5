#pragma once

#include <string>
#include <vector>

namespace docchat_core {

// Capability interface over an embedding model service.
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Throws ModelUnavailableError when the service cannot be reached.
  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  // One vector per input, in input order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto &text : texts) {
      out.push_back(get_embedding(text));
    }
    return out;
  }

  virtual bool is_server_available() = 0;
};

// Capability interface over an answer-generation model service.
class Generator {
 public:
  virtual ~Generator() = default;

  // Throws GenerationError (Unavailable or Timeout).
  virtual std::string generate(const std::string &prompt) = 0;
};

}  // namespace docchat_core
