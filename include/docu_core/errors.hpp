#pragma once

#include <exception>
#include <string>

namespace docu_core {

// Base of every error raised by the pipeline
class DocuMindError : public std::exception {
 public:
  explicit DocuMindError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Unreadable or unsupported source documents
class DocumentProcessingError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

class EmbeddingError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

class VectorStoreError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

// Any failure while answering a retrieval request
class RetrievalError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

class ChunkingError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

class LlmError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

// Caller supplied input that can never succeed (empty query, non-positive top_k)
class ValidationError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

class ConfigError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

// Only raised when strict citation checking is enabled
class CitationValidationError : public DocuMindError {
 public:
  using DocuMindError::DocuMindError;
};

}  // namespace docu_core
