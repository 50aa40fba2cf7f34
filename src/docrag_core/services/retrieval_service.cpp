#include "docrag_core/services/retrieval_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "docrag_core/collection/in_memory_collection.hpp"
#include "docrag_core/errors.hpp"

namespace docrag_core {

void to_json(nlohmann::json &j, const RetrievedChunk &chunk) {
  j = nlohmann::json{{"content", chunk.content},
                     {"metadata", chunk.metadata},
                     {"distance", chunk.distance}};
}

void to_json(nlohmann::json &j, const CollectionStats &stats) {
  j = nlohmann::json{{"total_chunks", stats.total_chunks},
                     {"embedding_model", stats.embedding_model},
                     {"persistent", stats.persistent}};
}

SearchOutcome SearchOutcome::failure(const std::string &message) {
  SearchOutcome outcome;
  outcome.status = Status::Failed;
  outcome.error = message;
  return outcome;
}

RetrievalService::RetrievalService(std::shared_ptr<EmbeddingProvider> embedding_provider,
                                   const CollectionFactory &persistent_factory)
    : embedding_provider_(std::move(embedding_provider)) {
  if (!embedding_provider_) {
    throw InvalidInputError("RetrievalService requires an embedding provider");
  }
  select_backend(persistent_factory);
}

void RetrievalService::select_backend(const CollectionFactory &persistent_factory) {
  if (!persistent_factory) {
    fall_back("persistent backend disabled");
    return;
  }
  try {
    auto collection = persistent_factory();
    if (!collection) {
      fall_back("persistent backend factory returned no collection");
      return;
    }
    collection_ = std::move(collection);
    state_ = BackendState::PersistentActive;
    std::cerr << "[RetrievalService] Persistent collection initialized" << std::endl;
  } catch (const BackendInitError &e) {
    fall_back(e.what());
  } catch (const std::exception &e) {
    // Anything escaping the factory is an init failure too
    fall_back(e.what());
  }
}

void RetrievalService::fall_back(const std::string &reason) {
  std::cerr << "[RetrievalService] Warning: persistent collection unavailable (" << reason
            << "). Using in-memory collection; indexed chunks will not survive a restart."
            << std::endl;
  collection_ = std::make_unique<InMemoryCollection>();
  state_ = BackendState::InMemoryActive;
  fallback_reason_ = reason;
}

void RetrievalService::add_document(const std::string &doc_id,
                                    const std::vector<std::string> &chunks,
                                    const DocumentInfo &info) {
  if (doc_id.empty()) {
    throw InvalidInputError("doc_id must not be empty");
  }
  if (chunks.empty()) {
    std::cerr << "[RetrievalService] Document " << doc_id << " has no chunks; nothing indexed"
              << std::endl;
    return;
  }

  // Embed outside any collection lock
  std::vector<Embedding> embeddings;
  try {
    embeddings = embedding_provider_->encode(chunks);
  } catch (const EmbeddingError &e) {
    std::cerr << "[RetrievalService] Embedding failed for " << doc_id << ": " << e.what()
              << std::endl;
    throw;
  } catch (const std::exception &e) {
    std::cerr << "[RetrievalService] Embedding failed for " << doc_id << ": " << e.what()
              << std::endl;
    throw EmbeddingError("Embedding failed for " + doc_id + ": " + e.what());
  }
  if (embeddings.size() != chunks.size()) {
    std::cerr << "[RetrievalService] Embedding provider returned " << embeddings.size()
              << " vectors for " << chunks.size() << " chunks of " << doc_id << std::endl;
    throw EmbeddingError("Embedding provider returned " + std::to_string(embeddings.size()) +
                         " vectors for " + std::to_string(chunks.size()) + " chunks");
  }

  std::vector<std::string> ids;
  std::vector<ChunkMetadata> metadatas;
  ids.reserve(chunks.size());
  metadatas.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    const int chunk_index = static_cast<int>(i);
    ids.push_back(make_entry_id(doc_id, chunk_index));
    metadatas.push_back({doc_id, info.filename, chunk_index, info.file_type});
  }

  try {
    collection_->add(ids, embeddings, chunks, metadatas);
  } catch (const RetrievalError &e) {
    std::cerr << "[RetrievalService] Failed to add " << doc_id << ": " << e.what() << std::endl;
    throw;
  }
}

SearchOutcome RetrievalService::search(const std::string &query, size_t top_k) {
  if (top_k == 0) {
    return SearchOutcome::failure("top_k must be greater than 0");
  }
  const bool blank = std::all_of(query.begin(), query.end(),
                                 [](unsigned char c) { return std::isspace(c); });
  if (blank) {
    return SearchOutcome::failure("Query must not be empty");
  }

  // Availability first: any failure below yields a Failed outcome instead of an exception.
  try {
    std::vector<Embedding> query_embedding = embedding_provider_->encode({query});
    if (query_embedding.size() != 1) {
      throw EmbeddingError("Expected one query embedding, got " +
                           std::to_string(query_embedding.size()));
    }

    std::vector<QueryHit> hits = collection_->query(query_embedding.front(), top_k);

    SearchOutcome outcome;
    outcome.results.reserve(hits.size());
    for (auto &hit : hits) {
      outcome.results.push_back({std::move(hit.document), std::move(hit.metadata), hit.distance});
    }
    return outcome;
  } catch (const std::exception &e) {
    std::cerr << "[RetrievalService] Search failed: " << e.what() << std::endl;
    return SearchOutcome::failure(e.what());
  }
}

bool RetrievalService::delete_document(const std::string &doc_id) {
  if (doc_id.empty()) {
    return false;
  }
  std::vector<std::string> ids = collection_->get_by_filter(MetadataFilter::for_doc_id(doc_id));
  if (ids.empty()) {
    return false;
  }
  collection_->remove(ids);
  return true;
}

CollectionStats RetrievalService::stats() {
  CollectionStats stats;
  stats.embedding_model = embedding_provider_->model_name();
  stats.persistent = collection_->is_persistent();
  try {
    stats.total_chunks = collection_->count();
  } catch (const RetrievalError &e) {
    std::cerr << "[RetrievalService] count() failed, reporting 0 chunks: " << e.what()
              << std::endl;
    stats.total_chunks = 0;
  }
  return stats;
}

}  // namespace docrag_core
