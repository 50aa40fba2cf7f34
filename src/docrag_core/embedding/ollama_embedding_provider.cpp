#include "docrag_core/embedding/ollama_embedding_provider.hpp"

#include "docrag_core/errors.hpp"
#include "ollama.hpp"

namespace docrag_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaEmbeddingProvider::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<Embedding> OllamaEmbeddingProvider::encode(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    throw EmbeddingError("Cannot embed an empty list of texts");
  }

  nlohmann::json json_response;
  try {
    // /api/embed accepts an array under "input" and answers with one vector per element
    ollama::request request;
    request["model"] = embedding_model_;
    request["input"] = texts;
    request["truncate"] = true;
    ollama::response response = ollama::generate_embeddings(request);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  }

  if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
    throw EmbeddingError("Response does not contain an embeddings array");
  }

  const auto &embeddings = json_response["embeddings"];
  if (embeddings.size() != texts.size()) {
    throw EmbeddingError("Expected " + std::to_string(texts.size()) + " embeddings, got " +
                         std::to_string(embeddings.size()));
  }

  std::vector<Embedding> vectors;
  vectors.reserve(embeddings.size());
  try {
    for (const auto &embedding : embeddings) {
      vectors.push_back(embedding.get<Embedding>());
    }
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding in response: " + std::string(e.what()));
  }

  const size_t dimension = vectors.front().size();
  for (const auto &vector : vectors) {
    if (vector.empty() || vector.size() != dimension) {
      throw EmbeddingError("Embedding dimensions are inconsistent within one batch");
    }
  }
  return vectors;
}

std::string OllamaEmbeddingProvider::model_name() const {
  return embedding_model_;
}

bool OllamaEmbeddingProvider::is_server_available() {
  return ollama::is_running();
}

}  // namespace docrag_core
