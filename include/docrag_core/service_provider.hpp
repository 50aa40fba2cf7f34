#pragma once

#include <memory>

#include "docrag_core/config.hpp"

namespace docrag_core {
class EmbeddingProvider;
class RetrievalService;
class DocumentRegistry;
class DocumentService;
}  // namespace docrag_core

namespace docrag_core {

// Owns the wired-up object graph for one process.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<EmbeddingProvider> embedding_provider,
                  std::shared_ptr<RetrievalService> retrieval_service,
                  std::shared_ptr<DocumentRegistry> registry,
                  std::shared_ptr<DocumentService> document_service)
      : embedding_provider_(embedding_provider),
        retrieval_service_(retrieval_service),
        registry_(registry),
        document_service_(document_service) {}

  /**
   * Builds the embedding provider named by the config, the retrieval service (persistent
   * backend unless disabled), the registry and the document service.
   * Throws EmbeddingError when the Ollama server cannot be reached.
   */
  static std::shared_ptr<ServiceProvider> from_config(const Config &config);

  static std::shared_ptr<EmbeddingProvider> make_embedding_provider(const Config &config);

  EmbeddingProvider &get_embedding_provider() {
    return *embedding_provider_;
  }
  RetrievalService &get_retrieval_service() {
    return *retrieval_service_;
  }
  DocumentRegistry &get_registry() {
    return *registry_;
  }
  DocumentService &get_document_service() {
    return *document_service_;
  }

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<RetrievalService> retrieval_service_;
  std::shared_ptr<DocumentRegistry> registry_;
  std::shared_ptr<DocumentService> document_service_;
};

}  // namespace docrag_core
