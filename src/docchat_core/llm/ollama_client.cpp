#include "docchat_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "docchat_core/errors.hpp"
#include "ollama.hpp"

namespace docchat_core {

namespace {

bool looks_like_timeout(const std::string &message) {
  std::string lowered(message);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.find("timeout") != std::string::npos ||
         lowered.find("timed out") != std::string::npos ||
         lowered.find("error was: read") != std::string::npos;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
  // An unreachable server is not fatal here; calls fail with retryable errors instead.
  if (!ollama::is_running()) {
    std::cerr << "Warning: Ollama server is not running at " << ollama_url_ << std::endl;
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  auto vectors = get_embeddings({text});
  if (vectors.empty()) {
    throw ModelUnavailableError("embedding response contained no vectors");
  }
  return std::move(vectors.front());
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    // One /api/embed call carries the whole batch as an input array.
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);

    return parse_embeddings_response(response.as_json_string());
  } catch (const ollama::exception &e) {
    throw ModelUnavailableError("embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::parse_embeddings_response(const std::string &body) {
  nlohmann::json json_response;
  try {
    json_response = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    throw ModelUnavailableError("embedding response is not JSON: " + std::string(e.what()));
  }
  if (!json_response.is_object() || !json_response.contains("embeddings")) {
    throw ModelUnavailableError("response does not contain an embeddings field");
  }

  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array()) {
    throw ModelUnavailableError("embeddings field is not an array");
  }
  try {
    if (!embeddings.empty() && !embeddings[0].is_array()) {
      // Older servers answer a single input with a flat vector
      return {embeddings.get<std::vector<float>>()};
    }
    return embeddings.get<std::vector<std::vector<float>>>();
  } catch (const nlohmann::json::exception &e) {
    throw ModelUnavailableError("embeddings field is malformed: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(generation_model_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    const std::string message = e.what();
    if (looks_like_timeout(message)) {
      throw GenerationError(GenerationErrorKind::Timeout, message);
    }
    throw GenerationError(GenerationErrorKind::Unavailable, message);
  } catch (const nlohmann::json::exception &e) {
    throw GenerationError(GenerationErrorKind::Unavailable,
                          "malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docchat_core
