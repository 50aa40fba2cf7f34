#include "docrag_core/collection/vector_collection.hpp"

#include <unordered_set>

#include "docrag_core/errors.hpp"

namespace docrag_core {

size_t validate_add_batch(const std::vector<std::string> &ids,
                          const std::vector<Embedding> &vectors,
                          const std::vector<std::string> &documents,
                          const std::vector<ChunkMetadata> &metadatas,
                          size_t expected_dimension) {
  if (vectors.size() != ids.size() || documents.size() != ids.size() ||
      metadatas.size() != ids.size()) {
    throw InvalidInputError("add() length mismatch: ids=" + std::to_string(ids.size()) +
                            ", vectors=" + std::to_string(vectors.size()) +
                            ", documents=" + std::to_string(documents.size()) +
                            ", metadatas=" + std::to_string(metadatas.size()));
  }
  if (ids.empty()) {
    return expected_dimension;
  }

  const size_t dimension = expected_dimension != 0 ? expected_dimension : vectors.front().size();
  if (dimension == 0) {
    throw InvalidInputError("Vectors must not be empty");
  }

  std::unordered_set<std::string> seen;
  seen.reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    if (ids[i].empty()) {
      throw InvalidInputError("Entry ids must not be empty");
    }
    if (!seen.insert(ids[i]).second) {
      throw InvalidInputError("Duplicate id within add() call: " + ids[i]);
    }
    if (vectors[i].size() != dimension) {
      throw InvalidInputError("Vector dimension mismatch for id " + ids[i] + ". Expected " +
                              std::to_string(dimension) + ", got " +
                              std::to_string(vectors[i].size()));
    }
    if (metadatas[i].doc_id.empty()) {
      throw InvalidInputError("Metadata for id " + ids[i] + " has no doc_id");
    }
  }
  return dimension;
}

void validate_query(const Embedding &query_vector, size_t top_k, size_t expected_dimension) {
  if (top_k == 0) {
    throw InvalidInputError("top_k must be greater than 0");
  }
  if (query_vector.empty()) {
    throw InvalidInputError("Query vector must not be empty");
  }
  if (expected_dimension != 0 && query_vector.size() != expected_dimension) {
    throw InvalidInputError("Query vector dimension mismatch. Expected " +
                            std::to_string(expected_dimension) + ", got " +
                            std::to_string(query_vector.size()));
  }
}

}  // namespace docrag_core
