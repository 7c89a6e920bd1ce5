#pragma once

#include <exception>
#include <string>

namespace docchat_core {

// Base for every error the pipeline reports upward.
class PipelineError : public std::exception {
 public:
  explicit PipelineError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Fatal at startup: invalid chunking, retrieval or retry parameters.
class InvalidConfigError : public PipelineError {
 public:
  explicit InvalidConfigError(const std::string &message)
      : PipelineError("Invalid configuration: " + message) {}
};

class ExtractionFailedError : public PipelineError {
 public:
  explicit ExtractionFailedError(const std::string &reason)
      : PipelineError("Extraction failed: " + reason), reason_(reason) {}

  const std::string &reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

// The backing model service is unreachable. Retryable.
class ModelUnavailableError : public PipelineError {
 public:
  explicit ModelUnavailableError(const std::string &message)
      : PipelineError("Model unavailable: " + message) {}
};

// A vector does not have the dimensionality fixed for the index. Never retried.
class DimensionMismatchError : public PipelineError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : PipelineError("Vector dimension mismatch. Expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  // Raised when a batch response holds a different number of vectors than inputs.
  static DimensionMismatchError vector_count(size_t expected, size_t actual) {
    return DimensionMismatchError(expected, actual,
                                  "Embedding count mismatch. Expected " +
                                      std::to_string(expected) + " vectors, got " +
                                      std::to_string(actual));
  }

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  DimensionMismatchError(size_t expected, size_t actual, const std::string &message)
      : PipelineError(message), expected_(expected), actual_(actual) {}

  size_t expected_;
  size_t actual_;
};

class ChunkNotFoundError : public PipelineError {
 public:
  explicit ChunkNotFoundError(const std::string &chunk_id)
      : PipelineError("Chunk " + chunk_id + " is referenced by the index but not stored"),
        chunk_id_(chunk_id) {}

  const std::string &chunk_id() const {
    return chunk_id_;
  }

 private:
  std::string chunk_id_;
};

enum class GenerationErrorKind { Unavailable, Timeout };

inline std::string to_string(GenerationErrorKind kind) {
  switch (kind) {
    case GenerationErrorKind::Unavailable:
      return "Unavailable";
    case GenerationErrorKind::Timeout:
      return "Timeout";
  }
  return "Unavailable";
}

class GenerationError : public PipelineError {
 public:
  GenerationError(GenerationErrorKind kind, const std::string &message)
      : PipelineError("Answer generation failed (" + to_string(kind) + "): " + message),
        kind_(kind) {}

  GenerationErrorKind kind() const {
    return kind_;
  }

 private:
  GenerationErrorKind kind_;
};

class OperationCancelledError : public PipelineError {
 public:
  explicit OperationCancelledError(const std::string &what_was_cancelled)
      : PipelineError("Operation cancelled: " + what_was_cancelled) {}
};

class InvalidTransitionError : public PipelineError {
 public:
  explicit InvalidTransitionError(const std::string &message) : PipelineError(message) {}
};

class DocumentNotFoundError : public PipelineError {
 public:
  explicit DocumentNotFoundError(long long document_id)
      : PipelineError("Document with ID " + std::to_string(document_id) + " not found") {}
};

class ConversationNotFoundError : public PipelineError {
 public:
  explicit ConversationNotFoundError(const std::string &conversation_id)
      : PipelineError("Conversation " + conversation_id + " not found") {}
};

class ConversationExistsError : public PipelineError {
 public:
  explicit ConversationExistsError(const std::string &conversation_id)
      : PipelineError("Conversation " + conversation_id + " already exists") {}
};

}  // namespace docchat_core
