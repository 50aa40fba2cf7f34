#pragma once

#include <stdexcept>
#include <string>

namespace docrag_core {

class RetrievalError : public std::exception {
 public:
  explicit RetrievalError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Mismatched batch lengths, duplicate ids, bad dimensions, empty queries.
class InvalidInputError : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

// Embedding model unreachable or returned malformed output.
class EmbeddingError : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

// The persistent backend could not be opened. Recovered by falling back to memory.
class BackendInitError : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

// add/query/delete failed at the storage layer.
class BackendOperationError : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

}  // namespace docrag_core
