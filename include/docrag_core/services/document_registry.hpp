#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docrag_core {

class DocumentRegistryError : public std::exception {
 public:
  explicit DocumentRegistryError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct DocumentRecord {
  std::string doc_id;
  std::string filename;
  std::string file_path;
  uint64_t file_size_bytes = 0;
  std::string upload_time;
  size_t chunk_count = 0;
  size_t text_length = 0;
  std::string file_type;
};

void to_json(nlohmann::json &j, const DocumentRecord &record);

/**
 * @brief JSON-file registry of ingested documents, stored at <documents_dir>/metadata.json.
 *
 * Every mutation rewrites the file. A missing file is an empty registry; an unreadable one is
 * a DocumentRegistryError.
 */
class DocumentRegistry {
 public:
  static constexpr const char *METADATA_FILE_NAME = "metadata.json";
  static constexpr size_t DOC_ID_LENGTH = 10;

  explicit DocumentRegistry(const std::filesystem::path &documents_dir);

  DocumentRegistry(const DocumentRegistry &) = delete;
  DocumentRegistry &operator=(const DocumentRegistry &) = delete;

  // First DOC_ID_LENGTH hex chars of SHA-256(filename + "-" + timestamp), unique in the registry.
  std::string create_doc_id(const std::string &filename) const;

  void add(const DocumentRecord &record);
  bool remove(const std::string &doc_id);
  std::optional<DocumentRecord> get(const std::string &doc_id) const;
  std::vector<DocumentRecord> list_all() const;
  size_t size() const;

  const std::filesystem::path &documents_dir() const { return documents_dir_; }
  const std::filesystem::path &metadata_file() const { return metadata_file_; }

  static std::string now_iso8601();

 private:
  std::filesystem::path documents_dir_;
  std::filesystem::path metadata_file_;
  std::map<std::string, DocumentRecord> records_;
  mutable std::mutex mutex_;

  void load();
  void save() const;
  static std::string sha256_hex(const std::string &content);
};

}  // namespace docrag_core
