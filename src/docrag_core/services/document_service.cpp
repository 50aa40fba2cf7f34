#include "docrag_core/services/document_service.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

#include "docrag_core/errors.hpp"

namespace docrag_core {

namespace {
constexpr std::array<const char *, 7> TEXT_EXTENSIONS = {".txt", ".md",  ".py", ".java",
                                                         ".cpp", ".js", ".json"};

std::string lower_extension(const std::filesystem::path &file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}
}  // namespace

DocumentService::DocumentService(std::shared_ptr<DocumentRegistry> registry,
                                 std::shared_ptr<RetrievalService> retrieval_service,
                                 TextChunker chunker)
    : registry_(std::move(registry)),
      retrieval_service_(std::move(retrieval_service)),
      chunker_(chunker) {}

bool DocumentService::is_supported_text_file(const std::filesystem::path &file_path) {
  const std::string extension = lower_extension(file_path);
  return std::find(TEXT_EXTENSIONS.begin(), TEXT_EXTENSIONS.end(), extension) !=
         TEXT_EXTENSIONS.end();
}

std::string DocumentService::read_text_file(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw InvalidInputError("Could not open file: " + file_path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

IngestResult DocumentService::ingest_text(const std::string &filename,
                                          const std::string &file_type,
                                          const std::string &text,
                                          const std::filesystem::path &stored_path) {
  if (filename.empty()) {
    throw InvalidInputError("filename must not be empty");
  }
  return register_and_index(registry_->create_doc_id(filename), filename, file_type, text,
                            stored_path);
}

IngestResult DocumentService::register_and_index(const std::string &doc_id,
                                                 const std::string &filename,
                                                 const std::string &file_type,
                                                 const std::string &text,
                                                 const std::filesystem::path &stored_path) {
  IngestResult result;
  result.chunks = chunker_.chunk(text);

  DocumentRecord &record = result.record;
  record.doc_id = doc_id;
  record.filename = filename;
  record.file_path = stored_path.string();
  record.upload_time = DocumentRegistry::now_iso8601();
  record.chunk_count = result.chunks.size();
  record.text_length = text.size();
  record.file_type = file_type;
  if (!stored_path.empty()) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(stored_path, ec);
    record.file_size_bytes = ec ? 0 : static_cast<uint64_t>(size);
  } else {
    record.file_size_bytes = text.size();
  }

  registry_->add(record);
  try {
    retrieval_service_->add_document(record.doc_id, result.chunks, {filename, file_type});
  } catch (const RetrievalError &e) {
    std::cerr << "[DocumentService] Indexing " << filename << " failed, withdrawing "
              << record.doc_id << ": " << e.what() << std::endl;
    registry_->remove(record.doc_id);
    throw;
  }

  std::cerr << "[DocumentService] Ingested " << filename << " as " << record.doc_id << " ("
            << record.chunk_count << " chunks)" << std::endl;
  return result;
}

IngestResult DocumentService::ingest_file(const std::filesystem::path &file_path) {
  if (!is_supported_text_file(file_path)) {
    throw InvalidInputError("Unsupported file type for text ingestion: " + file_path.string());
  }
  if (!std::filesystem::is_regular_file(file_path)) {
    throw InvalidInputError("Not a regular file: " + file_path.string());
  }

  const std::string filename = file_path.filename().string();
  const std::string doc_id = registry_->create_doc_id(filename);
  // Stored copies are keyed by doc id so same-named sources never share a file.
  const std::filesystem::path target = registry_->documents_dir() / (doc_id + "_" + filename);

  std::error_code ec;
  std::filesystem::copy_file(file_path, target, ec);
  if (ec) {
    throw InvalidInputError("Could not copy " + file_path.string() + " into " +
                            registry_->documents_dir().string() + ": " + ec.message());
  }

  try {
    return register_and_index(doc_id, filename, lower_extension(file_path),
                              read_text_file(target), target);
  } catch (const std::exception &) {
    std::filesystem::remove(target, ec);
    throw;
  }
}

bool DocumentService::remove_document(const std::string &doc_id) {
  std::optional<DocumentRecord> record = registry_->get(doc_id);
  if (!record) {
    return false;
  }

  // Vectors go first so a storage failure leaves the registry entry in place for a retry
  if (!retrieval_service_->delete_document(doc_id)) {
    std::cerr << "[DocumentService] No indexed chunks found for " << doc_id << std::endl;
  }

  if (!record->file_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(record->file_path, ec);
    if (ec) {
      std::cerr << "[DocumentService] Warning: could not remove stored copy "
                << record->file_path << ": " << ec.message() << std::endl;
    }
  }
  return registry_->remove(doc_id);
}

std::vector<DocumentRecord> DocumentService::list_documents() const {
  return registry_->list_all();
}

std::optional<DocumentRecord> DocumentService::get_document(const std::string &doc_id) const {
  return registry_->get(doc_id);
}

std::string DocumentService::build_context(const std::string &query, size_t top_k) {
  SearchOutcome outcome = retrieval_service_->search(query, top_k);
  if (!outcome.ok()) {
    std::cerr << "[DocumentService] No document context: " << outcome.error << std::endl;
    return "";
  }
  std::string context;
  for (const auto &hit : outcome.results) {
    if (!context.empty())
      context += "\n\n";
    context += hit.content;
  }
  return context;
}

}  // namespace docrag_core
