#include "docrag_core/db/database_manager.hpp"

#include <stdexcept>

#include "docrag_core/errors.hpp"

namespace docrag_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }
  if (pool_size <= 0) {
    throw std::invalid_argument("pool_size must be greater than 0");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->close();
  is_initialized_ = false;
}

SqliteHandle DatabaseManager::acquire() {
  if (!pool_) {
    throw BackendOperationError("Collection database has not been opened");
  }
  return pool_->acquire();
}

void DatabaseManager::release(SqliteHandle handle) {
  if (pool_) {
    pool_->release(std::move(handle));
  }
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "SELECT count(*) FROM sqlite_master;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS collection_info (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  // seq is the insertion order and doubles as the Faiss label
  db << R"(
      CREATE TABLE IF NOT EXISTS entries (
          seq INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          doc_id TEXT NOT NULL,
          filename TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          file_type TEXT NOT NULL,
          content BLOB,
          vector_blob BLOB NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_entries_doc_id
      ON entries(doc_id)
    )";
}

}  // namespace docrag_core
