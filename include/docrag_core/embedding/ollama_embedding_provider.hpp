#pragma once

#include <string>
#include <vector>

#include "docrag_core/embedding/embedding_provider.hpp"

namespace docrag_core {

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaEmbeddingProvider() override = default;

  // Disable copy constructor and assignment
  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  // One batch request for all texts.
  std::vector<Embedding> encode(const std::vector<std::string> &texts) override;

  std::string model_name() const override;

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace docrag_core
