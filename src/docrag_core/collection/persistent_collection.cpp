#include "docrag_core/collection/persistent_collection.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unordered_map>

#include "docrag_core/collection/vector_math.hpp"
#include "docrag_core/db/pooled_connection.hpp"
#include "docrag_core/db/sqlite_error_utils.hpp"
#include "docrag_core/db/transaction.hpp"
#include "docrag_core/errors.hpp"
#include "docrag_core/services/compression_service.hpp"

namespace docrag_core {

namespace {

std::string seq_vector_to_comma_string(const std::vector<faiss::idx_t> &seqs) {
  std::stringstream ss;
  for (size_t i = 0; i < seqs.size(); ++i) {
    ss << seqs[i];
    if (i < seqs.size() - 1)
      ss << ",";
  }
  return ss.str();
}

std::vector<char> vector_to_blob(const Embedding &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

}  // namespace

PersistentCollection::PersistentCollection(const std::filesystem::path &db_path, int pool_size)
    : db_manager_(std::make_unique<DatabaseManager>()) {
  try {
    db_manager_->initialize(db_path, pool_size);
    load_dimension();
    rebuild_index_locked();
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_init_error("open " + db_path.string(), e);
  } catch (const std::filesystem::filesystem_error &e) {
    throw BackendInitError("Cannot create collection directory: " + std::string(e.what()));
  } catch (const faiss::FaissException &e) {
    throw BackendInitError("Cannot build Faiss index: " + std::string(e.what()));
  } catch (const RetrievalError &e) {
    throw BackendInitError(e.what());
  } catch (const std::runtime_error &e) {
    throw BackendInitError(e.what());
  } catch (const std::invalid_argument &e) {
    throw BackendInitError(e.what());
  }
  std::cerr << "[PersistentCollection] Opened " << db_path << " (" << indexed_vectors()
            << " vectors, dimension " << dimension_ << ")" << std::endl;
}

PersistentCollection::~PersistentCollection() {
  db_manager_->shutdown();
}

void PersistentCollection::load_dimension() {
  PooledConnection conn(*db_manager_);
  std::string stored;
  *conn << "SELECT value FROM collection_info WHERE key = 'dimension'" >>
      [&](std::string value) { stored = std::move(value); };
  if (stored.empty()) {
    dimension_ = 0;
    return;
  }
  try {
    dimension_ = static_cast<size_t>(std::stoul(stored));
  } catch (const std::logic_error &) {
    throw BackendInitError("Corrupt collection dimension: " + stored);
  }
}

std::unique_ptr<faiss::IndexIDMap> PersistentCollection::create_base_index(size_t dimension) const {
  // Inner product over unit vectors is cosine similarity
  auto base_index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
  auto index = std::make_unique<faiss::IndexIDMap>(base_index.get());
  index->own_fields = true;
  base_index.release();
  return index;
}

void PersistentCollection::rebuild_index() {
  std::unique_lock lock(mutex_);
  try {
    rebuild_index_locked();
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("rebuild_index", e);
  } catch (const faiss::FaissException &e) {
    throw BackendOperationError("rebuild_index failed: " + std::string(e.what()));
  }
}

void PersistentCollection::rebuild_index_locked() {
  if (dimension_ == 0) {
    index_.reset();
    return;
  }

  std::vector<faiss::idx_t> labels;
  std::vector<float> all_vectors_flat;
  {
    // Scope the connection strictly to the DB fetch
    PooledConnection conn(*db_manager_);
    *conn << "SELECT seq, vector_blob FROM entries ORDER BY seq" >>
        [&](int64_t seq, std::vector<char> vector_blob) {
          if (vector_blob.size() == dimension_ * sizeof(float)) {
            labels.push_back(seq);
            const size_t offset = all_vectors_flat.size();
            all_vectors_flat.resize(offset + dimension_);
            std::memcpy(all_vectors_flat.data() + offset, vector_blob.data(), vector_blob.size());
            normalize_in_place(all_vectors_flat.data() + offset, dimension_);
          } else {
            std::cerr << "[PersistentCollection] Warning: skipping entry seq " << seq
                      << " during index rebuild due to mismatched vector size. Expected "
                      << dimension_ * sizeof(float) << " bytes, got " << vector_blob.size()
                      << " bytes." << std::endl;
          }
        };
  }

  auto fresh = create_base_index(dimension_);
  if (!labels.empty()) {
    fresh->add_with_ids(static_cast<faiss::idx_t>(labels.size()), all_vectors_flat.data(),
                        labels.data());
  }
  index_ = std::move(fresh);
}

void PersistentCollection::add(const std::vector<std::string> &ids,
                               const std::vector<Embedding> &vectors,
                               const std::vector<std::string> &documents,
                               const std::vector<ChunkMetadata> &metadatas) {
  std::unique_lock lock(mutex_);
  const size_t dimension = validate_add_batch(ids, vectors, documents, metadatas, dimension_);
  if (ids.empty())
    return;

  std::vector<faiss::idx_t> seqs;
  seqs.reserve(ids.size());
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TxMode::Immediate);

    for (const auto &id : ids) {
      bool exists = false;
      *conn << "SELECT 1 FROM entries WHERE id = ? LIMIT 1" << id >> [&](int /*dummy*/) {
        exists = true;
      };
      if (exists) {
        throw InvalidInputError("Id already present in collection: " + id);
      }
    }

    for (size_t i = 0; i < ids.size(); ++i) {
      *conn << "INSERT INTO entries (id, doc_id, filename, chunk_index, file_type, content, "
               "vector_blob) VALUES (?,?,?,?,?,?,?)"
            << ids[i] << metadatas[i].doc_id << metadatas[i].filename << metadatas[i].chunk_index
            << metadatas[i].file_type << CompressionService::compress(documents[i])
            << vector_to_blob(vectors[i]);
      seqs.push_back(static_cast<faiss::idx_t>(conn->last_insert_rowid()));
    }

    if (dimension_ == 0) {
      *conn << "INSERT OR REPLACE INTO collection_info (key, value) VALUES ('dimension', ?)"
            << std::to_string(dimension);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("add", e);
  }

  dimension_ = dimension;
  try {
    if (!index_) {
      index_ = create_base_index(dimension_);
    }
    std::vector<float> flat(ids.size() * dimension_);
    for (size_t i = 0; i < ids.size(); ++i) {
      std::copy(vectors[i].begin(), vectors[i].end(), flat.begin() + i * dimension_);
      normalize_in_place(flat.data() + i * dimension_, dimension_);
    }
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), seqs.data());
  } catch (const faiss::FaissException &e) {
    std::cerr << "[PersistentCollection] Index update failed after commit, rebuilding: "
              << e.what() << std::endl;
    try {
      rebuild_index_locked();
    } catch (const sqlite::sqlite_exception &db_error) {
      throw backend_error("add (index rebuild)", db_error);
    } catch (const faiss::FaissException &rebuild_error) {
      throw BackendOperationError("add (index rebuild) failed: " +
                                  std::string(rebuild_error.what()));
    }
  }
}

std::vector<PersistentCollection::RankedLabel> PersistentCollection::search_index(
    const Embedding &unit_query, size_t top_k) const {
  const faiss::idx_t ntotal = index_->ntotal;
  const faiss::idx_t wanted = static_cast<faiss::idx_t>(std::min<size_t>(top_k, ntotal));
  faiss::idx_t k = std::min<faiss::idx_t>(ntotal, wanted + 1);

  std::vector<float> similarities;
  std::vector<faiss::idx_t> labels;
  while (true) {
    similarities.assign(k, 0.0f);
    labels.assign(k, -1);
    index_->search(1, unit_query.data(), k, similarities.data(), labels.data());
    // Widen until everything tied with the last wanted hit is inside the window
    if (k >= ntotal || similarities[k - 1] < similarities[wanted - 1])
      break;
    k = std::min<faiss::idx_t>(ntotal, k * 2);
  }

  std::vector<RankedLabel> ranked;
  ranked.reserve(k);
  for (faiss::idx_t i = 0; i < k; ++i) {
    if (labels[i] != -1) {
      ranked.push_back({labels[i], similarities[i]});
    }
  }
  std::sort(ranked.begin(), ranked.end(), [](const RankedLabel &a, const RankedLabel &b) {
    if (a.similarity != b.similarity)
      return a.similarity > b.similarity;
    return a.seq < b.seq;
  });
  if (ranked.size() > static_cast<size_t>(wanted)) {
    ranked.resize(wanted);
  }
  return ranked;
}

std::vector<QueryHit> PersistentCollection::fetch_hits(const std::vector<RankedLabel> &ranked) {
  if (ranked.empty()) {
    return {};
  }

  std::vector<faiss::idx_t> seqs;
  seqs.reserve(ranked.size());
  for (const auto &label : ranked) {
    seqs.push_back(label.seq);
  }

  std::unordered_map<int64_t, std::pair<std::string, ChunkMetadata>> rows;
  {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT seq, doc_id, filename, chunk_index, file_type, content FROM entries "
             "WHERE seq IN (" + seq_vector_to_comma_string(seqs) + ")" >>
        [&](int64_t seq, std::string doc_id, std::string filename, int chunk_index,
            std::string file_type, std::optional<std::vector<char>> content) {
          ChunkMetadata metadata{std::move(doc_id), std::move(filename), chunk_index,
                                 std::move(file_type)};
          rows[seq] = {CompressionService::decompress(content), std::move(metadata)};
        };
  }

  // Assemble results in ranking order
  std::vector<QueryHit> hits;
  hits.reserve(ranked.size());
  for (const auto &label : ranked) {
    auto it = rows.find(label.seq);
    if (it == rows.end()) {
      std::cerr << "[PersistentCollection] Warning: Faiss returned seq " << label.seq
                << " but no corresponding row found in DB." << std::endl;
      continue;
    }
    hits.push_back({std::move(it->second.first), std::move(it->second.second),
                    1.0f - label.similarity});
  }
  return hits;
}

std::vector<QueryHit> PersistentCollection::query(const Embedding &query_vector, size_t top_k) {
  std::shared_lock lock(mutex_);
  validate_query(query_vector, top_k, dimension_);
  if (!index_ || index_->ntotal == 0) {
    return {};
  }

  Embedding unit_query = query_vector;
  normalize_in_place(unit_query.data(), dimension_);

  try {
    return fetch_hits(search_index(unit_query, top_k));
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("query", e);
  } catch (const faiss::FaissException &e) {
    throw BackendOperationError("query failed: " + std::string(e.what()));
  }
}

std::vector<std::string> PersistentCollection::get_by_filter(const MetadataFilter &filter) {
  std::shared_lock lock(mutex_);

  std::vector<std::string> clauses;
  if (filter.doc_id)
    clauses.push_back("doc_id = ?");
  if (filter.filename)
    clauses.push_back("filename = ?");
  if (filter.chunk_index)
    clauses.push_back("chunk_index = ?");
  if (filter.file_type)
    clauses.push_back("file_type = ?");

  std::string sql = "SELECT id FROM entries";
  for (size_t i = 0; i < clauses.size(); ++i) {
    sql += (i == 0 ? " WHERE " : " AND ") + clauses[i];
  }
  sql += " ORDER BY seq";

  std::vector<std::string> ids;
  try {
    PooledConnection conn(*db_manager_);
    auto statement = *conn << sql;
    // Bind in the same order the clauses were appended
    if (filter.doc_id)
      statement << *filter.doc_id;
    if (filter.filename)
      statement << *filter.filename;
    if (filter.chunk_index)
      statement << *filter.chunk_index;
    if (filter.file_type)
      statement << *filter.file_type;
    statement >> [&](std::string id) { ids.push_back(std::move(id)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("get_by_filter", e);
  }
  return ids;
}

void PersistentCollection::remove(const std::vector<std::string> &ids) {
  std::unique_lock lock(mutex_);
  if (ids.empty())
    return;

  std::vector<faiss::idx_t> removed;
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, TxMode::Immediate);
    for (const auto &id : ids) {
      *conn << "SELECT seq FROM entries WHERE id = ?" << id >>
          [&](int64_t seq) { removed.push_back(static_cast<faiss::idx_t>(seq)); };
      *conn << "DELETE FROM entries WHERE id = ?" << id;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("remove", e);
  }

  if (removed.empty() || !index_) {
    return;
  }
  try {
    faiss::IDSelectorBatch selector(removed.size(), removed.data());
    index_->remove_ids(selector);
  } catch (const faiss::FaissException &e) {
    std::cerr << "[PersistentCollection] Index removal failed after commit, rebuilding: "
              << e.what() << std::endl;
    try {
      rebuild_index_locked();
    } catch (const sqlite::sqlite_exception &db_error) {
      throw backend_error("remove (index rebuild)", db_error);
    } catch (const faiss::FaissException &rebuild_error) {
      throw BackendOperationError("remove (index rebuild) failed: " +
                                  std::string(rebuild_error.what()));
    }
  }
}

size_t PersistentCollection::count() {
  std::shared_lock lock(mutex_);
  int64_t total = 0;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT COUNT(*) FROM entries" >> total;
  } catch (const sqlite::sqlite_exception &e) {
    throw backend_error("count", e);
  }
  return static_cast<size_t>(total);
}

size_t PersistentCollection::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

size_t PersistentCollection::indexed_vectors() const {
  std::shared_lock lock(mutex_);
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

}  // namespace docrag_core
