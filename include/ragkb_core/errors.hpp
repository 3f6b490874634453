#pragma once

#include <exception>
#include <string>

namespace ragkb_core {

enum class ErrorKind {
  Configuration,
  CorpusNotFound,
  EmptyCorpus,
  IndexNotFound,
  IndexIntegrity,
  DimensionMismatch,
  Embedding,
  VectorIndex,
  Storage,
  LanguageDetection,
  Synthesis,
  InvalidRequest
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Configuration:
      return "configuration";
    case ErrorKind::CorpusNotFound:
      return "corpus_not_found";
    case ErrorKind::EmptyCorpus:
      return "empty_corpus";
    case ErrorKind::IndexNotFound:
      return "index_not_found";
    case ErrorKind::IndexIntegrity:
      return "index_integrity";
    case ErrorKind::DimensionMismatch:
      return "dimension_mismatch";
    case ErrorKind::Embedding:
      return "embedding";
    case ErrorKind::VectorIndex:
      return "vector_index";
    case ErrorKind::Storage:
      return "storage";
    case ErrorKind::LanguageDetection:
      return "language_detection";
    case ErrorKind::Synthesis:
      return "synthesis";
    case ErrorKind::InvalidRequest:
      return "invalid_request";
    default:
      return "unknown";
  }
}

// Base of every failure raised by the retrieval core. Access layers switch on
// kind() to pick a status code; the message is meant for humans.
class RagkbError : public std::exception {
 public:
  RagkbError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class ConfigurationError : public RagkbError {
 public:
  explicit ConfigurationError(const std::string &message)
      : RagkbError(ErrorKind::Configuration, message) {}
};

class CorpusNotFoundError : public RagkbError {
 public:
  explicit CorpusNotFoundError(const std::string &message)
      : RagkbError(ErrorKind::CorpusNotFound, message) {}
};

class EmptyCorpusError : public RagkbError {
 public:
  explicit EmptyCorpusError(const std::string &message)
      : RagkbError(ErrorKind::EmptyCorpus, message) {}
};

class IndexNotFoundError : public RagkbError {
 public:
  explicit IndexNotFoundError(const std::string &message)
      : RagkbError(ErrorKind::IndexNotFound, message) {}
};

class IndexIntegrityError : public RagkbError {
 public:
  explicit IndexIntegrityError(const std::string &message)
      : RagkbError(ErrorKind::IndexIntegrity, message) {}
};

class DimensionMismatchError : public RagkbError {
 public:
  explicit DimensionMismatchError(const std::string &message)
      : RagkbError(ErrorKind::DimensionMismatch, message) {}
};

class EmbeddingError : public RagkbError {
 public:
  explicit EmbeddingError(const std::string &message)
      : RagkbError(ErrorKind::Embedding, message) {}
};

class VectorIndexError : public RagkbError {
 public:
  explicit VectorIndexError(const std::string &message)
      : RagkbError(ErrorKind::VectorIndex, message) {}
};

class StorageError : public RagkbError {
 public:
  explicit StorageError(const std::string &message)
      : RagkbError(ErrorKind::Storage, message) {}
};

class LanguageDetectionError : public RagkbError {
 public:
  explicit LanguageDetectionError(const std::string &message)
      : RagkbError(ErrorKind::LanguageDetection, message) {}
};

class SynthesisError : public RagkbError {
 public:
  explicit SynthesisError(const std::string &message)
      : RagkbError(ErrorKind::Synthesis, message) {}
};

class InvalidRequestError : public RagkbError {
 public:
  explicit InvalidRequestError(const std::string &message)
      : RagkbError(ErrorKind::InvalidRequest, message) {}
};

}  // namespace ragkb_core
