#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "docrag_core/collection/vector_collection.hpp"

namespace docrag_core {

// Volatile brute-force backend. Vectors are normalized on insert and kept in one flat,
// row-major buffer that grows amortized; queries scan every row.
class InMemoryCollection : public VectorCollection {
 public:
  InMemoryCollection() = default;

  InMemoryCollection(const InMemoryCollection &) = delete;
  InMemoryCollection &operator=(const InMemoryCollection &) = delete;

  void add(const std::vector<std::string> &ids,
           const std::vector<Embedding> &vectors,
           const std::vector<std::string> &documents,
           const std::vector<ChunkMetadata> &metadatas) override;

  std::vector<QueryHit> query(const Embedding &query_vector, size_t top_k) override;
  std::vector<std::string> get_by_filter(const MetadataFilter &filter) override;
  void remove(const std::vector<std::string> &ids) override;
  size_t count() override;
  bool is_persistent() const override { return false; }

  // 0 until the first add fixes it.
  size_t dimension() const;

 private:
  mutable std::shared_mutex mutex_;
  size_t dimension_ = 0;
  std::vector<std::string> ids_;
  std::vector<std::string> documents_;
  std::vector<ChunkMetadata> metadatas_;
  std::vector<float> unit_vectors_;
  std::unordered_set<std::string> id_set_;
};

}  // namespace docrag_core
