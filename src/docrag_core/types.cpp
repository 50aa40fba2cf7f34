#include "docrag_core/types/chunk.hpp"

namespace docrag_core {

void to_json(nlohmann::json &j, const ChunkMetadata &metadata) {
  j = nlohmann::json{{"doc_id", metadata.doc_id},
                     {"filename", metadata.filename},
                     {"chunk_index", metadata.chunk_index},
                     {"file_type", metadata.file_type}};
}

void from_json(const nlohmann::json &j, ChunkMetadata &metadata) {
  j.at("doc_id").get_to(metadata.doc_id);
  metadata.filename = j.value("filename", std::string());
  metadata.chunk_index = j.value("chunk_index", 0);
  metadata.file_type = j.value("file_type", std::string());
}

MetadataFilter MetadataFilter::for_doc_id(const std::string &doc_id) {
  MetadataFilter filter;
  filter.doc_id = doc_id;
  return filter;
}

bool MetadataFilter::matches(const ChunkMetadata &metadata) const {
  if (doc_id && *doc_id != metadata.doc_id)
    return false;
  if (filename && *filename != metadata.filename)
    return false;
  if (chunk_index && *chunk_index != metadata.chunk_index)
    return false;
  if (file_type && *file_type != metadata.file_type)
    return false;
  return true;
}

bool MetadataFilter::empty() const {
  return !doc_id && !filename && !chunk_index && !file_type;
}

std::string make_entry_id(const std::string &doc_id, int chunk_index) {
  return doc_id + "_" + std::to_string(chunk_index);
}

}  // namespace docrag_core
