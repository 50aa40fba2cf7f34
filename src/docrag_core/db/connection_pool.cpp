#include "docrag_core/db/connection_pool.hpp"

#include "docrag_core/errors.hpp"

namespace docrag_core {

ConnectionPool::ConnectionPool(std::string db_path, int pool_size, int busy_timeout_ms)
    : db_path_(std::move(db_path)),
      busy_timeout_ms_(busy_timeout_ms),
      capacity_(static_cast<std::size_t>(pool_size)) {
  idle_.reserve(capacity_);
  for (std::size_t i = 0; i < capacity_; ++i) {
    idle_.push_back(open_handle());
  }
}

SqliteHandle ConnectionPool::open_handle() const {
  auto handle = std::make_unique<sqlite::database>(db_path_);
  // Touching sqlite_master rejects files that are not databases before any lease.
  *handle << "SELECT count(*) FROM sqlite_master;";
  *handle << "PRAGMA journal_mode = WAL;";
  *handle << "PRAGMA synchronous = NORMAL;";
  *handle << ("PRAGMA busy_timeout = " + std::to_string(busy_timeout_ms_) + ";");
  return handle;
}

SqliteHandle ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  handle_returned_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw BackendOperationError("Collection database '" + db_path_ + "' is closed");
  }
  SqliteHandle handle = std::move(idle_.back());
  idle_.pop_back();
  return handle;
}

void ConnectionPool::release(SqliteHandle handle) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A handle leased before a reopen may come back to the new pool.
    if (closed_ || !handle || idle_.size() >= capacity_) {
      return;
    }
    idle_.push_back(std::move(handle));
  }
  handle_returned_.notify_one();
}

void ConnectionPool::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.clear();
  }
  handle_returned_.notify_all();
}

std::size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace docrag_core
