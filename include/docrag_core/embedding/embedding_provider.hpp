#pragma once

#include <string>
#include <vector>

namespace docrag_core {

using Embedding = std::vector<float>;

// Maps texts to fixed-dimension vectors, one per input, in input order.
// Implementations must be pure functions of their input and model configuration.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Throws EmbeddingError when the model is unavailable or texts is empty.
  virtual std::vector<Embedding> encode(const std::vector<std::string> &texts) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace docrag_core
