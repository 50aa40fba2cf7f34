#include "docrag_core/service_provider.hpp"

#include <iostream>

#include "docrag_core/chunking/text_chunker.hpp"
#include "docrag_core/collection/persistent_collection.hpp"
#include "docrag_core/embedding/hashing_embedding_provider.hpp"
#include "docrag_core/embedding/ollama_embedding_provider.hpp"
#include "docrag_core/services/document_registry.hpp"
#include "docrag_core/services/document_service.hpp"
#include "docrag_core/services/retrieval_service.hpp"

namespace docrag_core {

std::shared_ptr<EmbeddingProvider> ServiceProvider::make_embedding_provider(const Config &config) {
  if (config.embedding_provider == "hashing") {
    return std::make_shared<HashingEmbeddingProvider>(
        static_cast<size_t>(config.hashing_dimension));
  }
  return std::make_shared<OllamaEmbeddingProvider>(config.ollama_url, config.embedding_model);
}

std::shared_ptr<ServiceProvider> ServiceProvider::from_config(const Config &config) {
  std::cerr << "[ServiceProvider] Index DB Path: " << config.index_db_path << std::endl;
  std::cerr << "[ServiceProvider] Documents Dir: " << config.documents_dir << std::endl;
  std::cerr << "[ServiceProvider] Embedding Provider: " << config.embedding_provider << std::endl;

  auto embedding_provider = make_embedding_provider(config);

  RetrievalService::CollectionFactory persistent_factory;
  if (config.persistent_enabled) {
    const std::string db_path = config.index_db_path;
    const int pool_size = config.pool_size;
    persistent_factory = [db_path, pool_size]() -> std::unique_ptr<VectorCollection> {
      return std::make_unique<PersistentCollection>(db_path, pool_size);
    };
  }

  auto retrieval_service =
      std::make_shared<RetrievalService>(embedding_provider, persistent_factory);
  auto registry = std::make_shared<DocumentRegistry>(config.documents_dir);
  auto document_service = std::make_shared<DocumentService>(
      registry, retrieval_service,
      TextChunker(static_cast<size_t>(config.chunk_size),
                  static_cast<size_t>(config.chunk_overlap)));

  return std::make_shared<ServiceProvider>(embedding_provider, retrieval_service, registry,
                                           document_service);
}

}  // namespace docrag_core
