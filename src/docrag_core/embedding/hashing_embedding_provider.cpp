#include "docrag_core/embedding/hashing_embedding_provider.hpp"

#include <cctype>
#include <cmath>

#include "docrag_core/errors.hpp"

namespace docrag_core {

namespace {
constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

bool is_token_char(unsigned char c) {
  // Bytes >= 0x80 belong to UTF-8 sequences and stay inside the token.
  return std::isalnum(c) || c >= 0x80;
}
}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw EmbeddingError("Hashing embedding dimension must be greater than 0");
  }
}

uint64_t HashingEmbeddingProvider::fnv1a(std::string_view token) {
  uint64_t hash = FNV_OFFSET_BASIS;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= FNV_PRIME;
  }
  return hash;
}

std::vector<Embedding> HashingEmbeddingProvider::encode(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    throw EmbeddingError("Cannot embed an empty list of texts");
  }
  std::vector<Embedding> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

std::string HashingEmbeddingProvider::model_name() const {
  return "hashing-" + std::to_string(dimension_);
}

Embedding HashingEmbeddingProvider::embed_one(const std::string &text) const {
  Embedding vector(dimension_, 0.0f);
  std::string token;

  auto flush = [&]() {
    if (token.empty())
      return;
    const uint64_t hash = fnv1a(token);
    const float sign = (hash >> 63) ? -1.0f : 1.0f;
    vector[hash % dimension_] += sign;
    token.clear();
  };

  for (unsigned char c : text) {
    if (is_token_char(c)) {
      token.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();

  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  if (norm > 0.0) {
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float &v : vector) {
      v *= inv;
    }
  }
  return vector;
}

}  // namespace docrag_core
