#include "docrag_core/services/document_registry.hpp"

#include <openssl/evp.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace docrag_core {

void to_json(nlohmann::json &j, const DocumentRecord &record) {
  j = nlohmann::json{{"doc_id", record.doc_id},
                     {"filename", record.filename},
                     {"file_path", record.file_path},
                     {"file_size_bytes", record.file_size_bytes},
                     {"upload_time", record.upload_time},
                     {"chunk_count", record.chunk_count},
                     {"text_length", record.text_length},
                     {"file_type", record.file_type}};
}

namespace {

DocumentRecord record_from_json(const std::string &doc_id, const nlohmann::json &j) {
  DocumentRecord record;
  record.doc_id = doc_id;
  record.filename = j.value("filename", std::string());
  record.file_path = j.value("file_path", std::string());
  record.file_size_bytes = j.value("file_size_bytes", uint64_t{0});
  record.upload_time = j.value("upload_time", std::string());
  record.chunk_count = j.value("chunk_count", size_t{0});
  record.text_length = j.value("text_length", size_t{0});
  record.file_type = j.value("file_type", std::string());
  return record;
}

}  // namespace

DocumentRegistry::DocumentRegistry(const std::filesystem::path &documents_dir)
    : documents_dir_(documents_dir), metadata_file_(documents_dir / METADATA_FILE_NAME) {
  std::error_code ec;
  std::filesystem::create_directories(documents_dir_, ec);
  if (ec) {
    throw DocumentRegistryError("Cannot create documents directory " + documents_dir_.string() +
                                ": " + ec.message());
  }
  load();
}

void DocumentRegistry::load() {
  if (!std::filesystem::exists(metadata_file_)) {
    return;
  }
  std::ifstream in(metadata_file_);
  if (!in.is_open()) {
    throw DocumentRegistryError("Could not open registry file: " + metadata_file_.string());
  }

  nlohmann::json root;
  try {
    in >> root;
  } catch (const nlohmann::json::exception &e) {
    throw DocumentRegistryError("Corrupt registry file " + metadata_file_.string() + ": " +
                                e.what());
  }
  if (!root.is_object()) {
    throw DocumentRegistryError("Registry file must hold a JSON object: " +
                                metadata_file_.string());
  }

  try {
    for (const auto &[doc_id, value] : root.items()) {
      records_[doc_id] = record_from_json(doc_id, value);
    }
  } catch (const nlohmann::json::exception &e) {
    throw DocumentRegistryError("Malformed record in " + metadata_file_.string() + ": " +
                                e.what());
  }
}

void DocumentRegistry::save() const {
  nlohmann::json root = nlohmann::json::object();
  for (const auto &[doc_id, record] : records_) {
    nlohmann::json value = record;
    value.erase("doc_id");
    root[doc_id] = std::move(value);
  }

  // Serialize first; nlohmann rejects strings that are not valid UTF-8.
  std::string serialized;
  try {
    serialized = root.dump(2);
  } catch (const nlohmann::json::exception &e) {
    throw DocumentRegistryError("Cannot serialize registry: " + std::string(e.what()));
  }

  // Write beside the target and rename so readers never see a half-written file
  const std::filesystem::path tmp_path = metadata_file_.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw DocumentRegistryError("Could not write registry file: " + tmp_path.string());
    }
    out << serialized;
    if (!out) {
      throw DocumentRegistryError("Failed writing registry file: " + tmp_path.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, metadata_file_, ec);
  if (ec) {
    throw DocumentRegistryError("Could not replace registry file: " + ec.message());
  }
}

std::string DocumentRegistry::sha256_hex(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw DocumentRegistryError("Failed to create EVP context for hashing");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  const bool ok = EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(mdctx, content.data(), content.length()) == 1 &&
                  EVP_DigestFinal_ex(mdctx, hash, &hash_len) == 1;
  EVP_MD_CTX_free(mdctx);
  if (!ok) {
    throw DocumentRegistryError("SHA256 digest failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string DocumentRegistry::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000;
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
     << micros;
  return ss.str();
}

std::string DocumentRegistry::create_doc_id(const std::string &filename) const {
  const std::string base = filename + "-" + now_iso8601();
  std::lock_guard<std::mutex> lock(mutex_);
  for (int attempt = 0;; ++attempt) {
    const std::string salted = attempt == 0 ? base : base + "#" + std::to_string(attempt);
    std::string doc_id = sha256_hex(salted).substr(0, DOC_ID_LENGTH);
    if (!records_.count(doc_id)) {
      return doc_id;
    }
  }
}

void DocumentRegistry::add(const DocumentRecord &record) {
  if (record.doc_id.empty()) {
    throw DocumentRegistryError("Document record has no doc_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.count(record.doc_id)) {
    throw DocumentRegistryError("Document already registered: " + record.doc_id);
  }
  records_[record.doc_id] = record;
  try {
    save();
  } catch (const DocumentRegistryError &) {
    records_.erase(record.doc_id);
    throw;
  }
}

bool DocumentRegistry::remove(const std::string &doc_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(doc_id);
  if (it == records_.end()) {
    return false;
  }
  DocumentRecord removed = std::move(it->second);
  records_.erase(it);
  try {
    save();
  } catch (const DocumentRegistryError &) {
    records_[doc_id] = std::move(removed);
    throw;
  }
  return true;
}

std::optional<DocumentRecord> DocumentRegistry::get(const std::string &doc_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(doc_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DocumentRecord> DocumentRegistry::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DocumentRecord> all;
  all.reserve(records_.size());
  for (const auto &[doc_id, record] : records_) {
    all.push_back(record);
  }
  return all;
}

size_t DocumentRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace docrag_core
