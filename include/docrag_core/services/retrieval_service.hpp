#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docrag_core/collection/vector_collection.hpp"
#include "docrag_core/embedding/embedding_provider.hpp"
#include "docrag_core/types/chunk.hpp"

namespace docrag_core {

// Document-level fields copied into every chunk's metadata.
struct DocumentInfo {
  std::string filename;
  std::string file_type;
};

struct RetrievedChunk {
  std::string content;
  ChunkMetadata metadata;
  float distance;
};

void to_json(nlohmann::json &j, const RetrievedChunk &chunk);

// Search never throws. A failed search reports Failed with the reason and no hits, so callers
// can tell "nothing matched" from "search is broken".
struct SearchOutcome {
  enum class Status { Ok, Failed };

  Status status = Status::Ok;
  std::vector<RetrievedChunk> results;
  std::string error;

  bool ok() const { return status == Status::Ok; }
  static SearchOutcome failure(const std::string &message);
};

struct CollectionStats {
  size_t total_chunks = 0;
  std::string embedding_model;
  bool persistent = false;
};

void to_json(nlohmann::json &j, const CollectionStats &stats);

/**
 * @brief Embeds documents and queries and routes them to the active VectorCollection.
 *
 * The backend is chosen once at construction: the persistent factory is tried, and any failure
 * falls back to an InMemoryCollection for the lifetime of the service. There is no reconnect.
 *
 * Embedding happens before any collection lock is taken. delete_document resolves ids and then
 * removes them in two steps; a concurrent add_document for the same doc_id can slip between
 * them, so callers must serialize add and delete per document if that matters.
 */
class RetrievalService {
 public:
  enum class BackendState { PersistentActive, InMemoryActive };

  using CollectionFactory = std::function<std::unique_ptr<VectorCollection>()>;

  static constexpr size_t DEFAULT_TOP_K = 5;

  // An empty factory skips straight to the in-memory backend.
  RetrievalService(std::shared_ptr<EmbeddingProvider> embedding_provider,
                   const CollectionFactory &persistent_factory);

  RetrievalService(const RetrievalService &) = delete;
  RetrievalService &operator=(const RetrievalService &) = delete;

  /**
   * Embeds all chunks in one call and writes them with a single add(). Ids are
   * "{doc_id}_{i}". Throws InvalidInputError, EmbeddingError or BackendOperationError; nothing is
   * written when embedding fails. Atomicity of the write itself is whatever the backend's add()
   * provides: both bundled backends validate before mutating and the persistent one commits in
   * one transaction, but this is best effort rather than a cross-component transaction.
   */
  void add_document(const std::string &doc_id,
                    const std::vector<std::string> &chunks,
                    const DocumentInfo &info);

  SearchOutcome search(const std::string &query, size_t top_k = DEFAULT_TOP_K);

  // False when no entry carries doc_id. Storage failures propagate.
  bool delete_document(const std::string &doc_id);

  CollectionStats stats();

  BackendState backend_state() const { return state_; }
  const std::optional<std::string> &fallback_reason() const { return fallback_reason_; }

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::unique_ptr<VectorCollection> collection_;
  BackendState state_ = BackendState::InMemoryActive;
  std::optional<std::string> fallback_reason_;

  void select_backend(const CollectionFactory &persistent_factory);
  void fall_back(const std::string &reason);
};

}  // namespace docrag_core
