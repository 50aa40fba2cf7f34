#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docrag_core/embedding/embedding_provider.hpp"
#include "docrag_core/types/chunk.hpp"

namespace docrag_core {

/**
 * @brief Storage capability shared by every retrieval backend.
 *
 * Similarity is cosine: distance = 1 - dot(unit(query), unit(vector)), with zero-norm vectors
 * scoring 0 against everything. Query results are ordered by ascending distance, ties by
 * insertion order. Implementations serialize add/remove against each other and against reads.
 */
class VectorCollection {
 public:
  virtual ~VectorCollection() = default;

  // All four sequences must have equal length; ids must be new and unique within the call.
  // Throws InvalidInputError on violation and leaves the collection unchanged.
  virtual void add(const std::vector<std::string> &ids,
                   const std::vector<Embedding> &vectors,
                   const std::vector<std::string> &documents,
                   const std::vector<ChunkMetadata> &metadatas) = 0;

  // At most top_k hits. An empty collection yields an empty list.
  virtual std::vector<QueryHit> query(const Embedding &query_vector, size_t top_k) = 0;

  // Ids of matching entries in insertion order.
  virtual std::vector<std::string> get_by_filter(const MetadataFilter &filter) = 0;

  // Unknown ids are ignored.
  virtual void remove(const std::vector<std::string> &ids) = 0;

  virtual size_t count() = 0;

  // True when entries survive a process restart.
  virtual bool is_persistent() const = 0;
};

// Checks the add() contract shared by all backends and returns the batch dimension.
// expected_dimension of 0 accepts any non-zero dimension.
size_t validate_add_batch(const std::vector<std::string> &ids,
                          const std::vector<Embedding> &vectors,
                          const std::vector<std::string> &documents,
                          const std::vector<ChunkMetadata> &metadatas,
                          size_t expected_dimension);

void validate_query(const Embedding &query_vector, size_t top_k, size_t expected_dimension);

}  // namespace docrag_core
