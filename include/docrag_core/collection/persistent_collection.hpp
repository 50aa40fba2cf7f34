#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "docrag_core/collection/vector_collection.hpp"
#include "docrag_core/db/database_manager.hpp"

namespace docrag_core {

/**
 * @brief Durable backend: SQLite holds entries, vectors and compressed chunk text; an exact
 * inner-product Faiss index over unit vectors answers queries.
 *
 * The SQLite rows are the source of truth. The Faiss index is rebuilt from them at startup and
 * whenever an index update fails after a committed write. Faiss labels are the rows' insertion
 * sequence numbers, which also break similarity ties.
 */
class PersistentCollection : public VectorCollection {
 public:
  static constexpr int DEFAULT_POOL_SIZE = 4;

  // Throws BackendInitError if the database cannot be created, opened or indexed.
  explicit PersistentCollection(const std::filesystem::path &db_path,
                                int pool_size = DEFAULT_POOL_SIZE);
  ~PersistentCollection() override;

  PersistentCollection(const PersistentCollection &) = delete;
  PersistentCollection &operator=(const PersistentCollection &) = delete;

  void add(const std::vector<std::string> &ids,
           const std::vector<Embedding> &vectors,
           const std::vector<std::string> &documents,
           const std::vector<ChunkMetadata> &metadatas) override;

  std::vector<QueryHit> query(const Embedding &query_vector, size_t top_k) override;
  std::vector<std::string> get_by_filter(const MetadataFilter &filter) override;
  void remove(const std::vector<std::string> &ids) override;
  size_t count() override;
  bool is_persistent() const override { return true; }

  size_t dimension() const;
  size_t indexed_vectors() const;

  // Drops the Faiss index and reloads every stored vector.
  void rebuild_index();

 private:
  struct RankedLabel {
    faiss::idx_t seq;
    float similarity;
  };

  std::unique_ptr<DatabaseManager> db_manager_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  size_t dimension_ = 0;
  mutable std::shared_mutex mutex_;

  void load_dimension();
  void rebuild_index_locked();
  std::unique_ptr<faiss::IndexIDMap> create_base_index(size_t dimension) const;
  std::vector<RankedLabel> search_index(const Embedding &unit_query, size_t top_k) const;
  std::vector<QueryHit> fetch_hits(const std::vector<RankedLabel> &ranked);
};

}  // namespace docrag_core
