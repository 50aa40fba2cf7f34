#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docrag_core/chunking/text_chunker.hpp"
#include "docrag_core/services/document_registry.hpp"
#include "docrag_core/services/retrieval_service.hpp"

namespace docrag_core {

struct IngestResult {
  DocumentRecord record;
  std::vector<std::string> chunks;
};

// Upload and delete pipeline: registry bookkeeping, chunking and indexing kept in step.
class DocumentService {
 public:
  DocumentService(std::shared_ptr<DocumentRegistry> registry,
                  std::shared_ptr<RetrievalService> retrieval_service,
                  TextChunker chunker = TextChunker());

  /**
   * Chunks already-extracted text, registers the document and indexes its chunks.
   * If indexing fails the registry record is withdrawn and the error rethrown.
   */
  IngestResult ingest_text(const std::string &filename,
                           const std::string &file_type,
                           const std::string &text,
                           const std::filesystem::path &stored_path = {});

  // Copies the file into the documents directory as "<doc_id>_<filename>", then reads it as text.
  // The stored copy is deleted again if registration or indexing fails.
  IngestResult ingest_file(const std::filesystem::path &file_path);

  // False if the registry has no such document.
  bool remove_document(const std::string &doc_id);

  std::vector<DocumentRecord> list_documents() const;
  std::optional<DocumentRecord> get_document(const std::string &doc_id) const;

  // Hit contents joined by blank lines; empty when nothing matched or search failed.
  std::string build_context(const std::string &query, size_t top_k);

  static bool is_supported_text_file(const std::filesystem::path &file_path);

 private:
  std::shared_ptr<DocumentRegistry> registry_;
  std::shared_ptr<RetrievalService> retrieval_service_;
  TextChunker chunker_;

  IngestResult register_and_index(const std::string &doc_id,
                                  const std::string &filename,
                                  const std::string &file_type,
                                  const std::string &text,
                                  const std::filesystem::path &stored_path);

  static std::string read_text_file(const std::filesystem::path &file_path);
};

}  // namespace docrag_core
