#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "docrag_core/embedding/embedding_provider.hpp"

namespace docrag_core {

// Offline feature-hashing embedder. Tokens are lower-cased alphanumeric runs; each token adds
// +-1 to the bucket picked by its FNV-1a hash, and the result is L2-normalized.
class HashingEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 384;

  explicit HashingEmbeddingProvider(size_t dimension = DEFAULT_DIMENSION);

  std::vector<Embedding> encode(const std::vector<std::string> &texts) override;
  std::string model_name() const override;

  size_t dimension() const { return dimension_; }

  static uint64_t fnv1a(std::string_view token);

 private:
  size_t dimension_;

  Embedding embed_one(const std::string &text) const;
};

}  // namespace docrag_core
