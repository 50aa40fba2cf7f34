#include "docrag_core/collection/in_memory_collection.hpp"

#include <algorithm>
#include <mutex>
#include <numeric>

#include "docrag_core/collection/vector_math.hpp"
#include "docrag_core/errors.hpp"

namespace docrag_core {

void InMemoryCollection::add(const std::vector<std::string> &ids,
                             const std::vector<Embedding> &vectors,
                             const std::vector<std::string> &documents,
                             const std::vector<ChunkMetadata> &metadatas) {
  std::unique_lock lock(mutex_);
  const size_t dimension = validate_add_batch(ids, vectors, documents, metadatas, dimension_);
  if (ids.empty())
    return;

  for (const auto &id : ids) {
    if (id_set_.count(id)) {
      throw InvalidInputError("Id already present in collection: " + id);
    }
  }

  // Everything is validated; from here on nothing throws except allocation.
  dimension_ = dimension;
  const size_t first_row = ids_.size();
  unit_vectors_.resize((first_row + ids.size()) * dimension_);
  for (size_t i = 0; i < ids.size(); ++i) {
    float *row = unit_vectors_.data() + (first_row + i) * dimension_;
    std::copy(vectors[i].begin(), vectors[i].end(), row);
    normalize_in_place(row, dimension_);
  }
  ids_.insert(ids_.end(), ids.begin(), ids.end());
  documents_.insert(documents_.end(), documents.begin(), documents.end());
  metadatas_.insert(metadatas_.end(), metadatas.begin(), metadatas.end());
  id_set_.insert(ids.begin(), ids.end());
}

std::vector<QueryHit> InMemoryCollection::query(const Embedding &query_vector, size_t top_k) {
  std::shared_lock lock(mutex_);
  validate_query(query_vector, top_k, dimension_);
  if (ids_.empty()) {
    return {};
  }

  Embedding unit_query = query_vector;
  normalize_in_place(unit_query.data(), dimension_);

  std::vector<float> similarities(ids_.size());
  for (size_t row = 0; row < ids_.size(); ++row) {
    similarities[row] =
        dot_product(unit_query.data(), unit_vectors_.data() + row * dimension_, dimension_);
  }

  std::vector<size_t> order(ids_.size());
  std::iota(order.begin(), order.end(), 0);
  // stable_sort keeps earlier insertions first on exact ties
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return similarities[a] > similarities[b]; });

  const size_t n = std::min(top_k, order.size());
  std::vector<QueryHit> hits;
  hits.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const size_t row = order[i];
    hits.push_back({documents_[row], metadatas_[row], 1.0f - similarities[row]});
  }
  return hits;
}

std::vector<std::string> InMemoryCollection::get_by_filter(const MetadataFilter &filter) {
  std::shared_lock lock(mutex_);
  std::vector<std::string> matched;
  for (size_t row = 0; row < ids_.size(); ++row) {
    if (filter.matches(metadatas_[row])) {
      matched.push_back(ids_[row]);
    }
  }
  return matched;
}

void InMemoryCollection::remove(const std::vector<std::string> &ids) {
  std::unique_lock lock(mutex_);
  std::unordered_set<std::string> doomed;
  for (const auto &id : ids) {
    if (id_set_.count(id)) {
      doomed.insert(id);
    }
  }
  if (doomed.empty())
    return;

  // Rebuild every array from the survivors, preserving their relative order.
  std::vector<std::string> kept_ids;
  std::vector<std::string> kept_documents;
  std::vector<ChunkMetadata> kept_metadatas;
  std::vector<float> kept_vectors;
  const size_t survivors = ids_.size() - doomed.size();
  kept_ids.reserve(survivors);
  kept_documents.reserve(survivors);
  kept_metadatas.reserve(survivors);
  kept_vectors.reserve(survivors * dimension_);

  for (size_t row = 0; row < ids_.size(); ++row) {
    if (doomed.count(ids_[row]))
      continue;
    kept_ids.push_back(std::move(ids_[row]));
    kept_documents.push_back(std::move(documents_[row]));
    kept_metadatas.push_back(std::move(metadatas_[row]));
    const float *begin = unit_vectors_.data() + row * dimension_;
    kept_vectors.insert(kept_vectors.end(), begin, begin + dimension_);
  }

  ids_ = std::move(kept_ids);
  documents_ = std::move(kept_documents);
  metadatas_ = std::move(kept_metadatas);
  unit_vectors_ = std::move(kept_vectors);
  for (const auto &id : doomed) {
    id_set_.erase(id);
  }
}

size_t InMemoryCollection::count() {
  std::shared_lock lock(mutex_);
  return ids_.size();
}

size_t InMemoryCollection::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

}  // namespace docrag_core
