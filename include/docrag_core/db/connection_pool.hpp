#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docrag_core {

using SqliteHandle = std::unique_ptr<sqlite::database>;

// Fixed-size set of WAL connections to one collection file.
// Idle handles are reused most-recently-returned first.
class ConnectionPool {
public:
    ConnectionPool(std::string db_path, int pool_size, int busy_timeout_ms = 5000);

    // Blocks while every handle is leased. Throws BackendOperationError once closed.
    SqliteHandle acquire();
    void release(SqliteHandle handle);

    // Drops idle handles and wakes waiters; handles still leased are discarded on release.
    void close();

    std::size_t idle_count() const;
    std::size_t capacity() const { return capacity_; }

private:
    SqliteHandle open_handle() const;

    std::string db_path_;
    int busy_timeout_ms_;
    std::size_t capacity_;
    bool closed_ = false;
    std::vector<SqliteHandle> idle_;
    mutable std::mutex mutex_;
    std::condition_variable handle_returned_;
};

} // namespace docrag_core
