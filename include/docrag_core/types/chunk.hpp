#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docrag_core {

// Metadata attached 1:1 to every stored vector.
struct ChunkMetadata {
  std::string doc_id;
  std::string filename;
  int chunk_index = 0;
  std::string file_type;

  bool operator==(const ChunkMetadata &other) const = default;
};

void to_json(nlohmann::json &j, const ChunkMetadata &metadata);
void from_json(const nlohmann::json &j, ChunkMetadata &metadata);

// Exact-match filter over ChunkMetadata. Unset fields match anything.
struct MetadataFilter {
  std::optional<std::string> doc_id;
  std::optional<std::string> filename;
  std::optional<int> chunk_index;
  std::optional<std::string> file_type;

  static MetadataFilter for_doc_id(const std::string &doc_id);

  bool matches(const ChunkMetadata &metadata) const;
  bool empty() const;
};

// One ranked row returned by a VectorCollection query.
struct QueryHit {
  std::string document;
  ChunkMetadata metadata;
  float distance;
};

// Entry id as stored in every collection: "{doc_id}_{chunk_index}".
std::string make_entry_id(const std::string &doc_id, int chunk_index);

}  // namespace docrag_core
