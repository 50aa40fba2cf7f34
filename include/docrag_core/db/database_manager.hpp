#pragma once

#include "docrag_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docrag_core {

// Owns the schema and the connection pool of one collection database file.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the parent directory and schema, then opens pool_size connections.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // Leasing goes through PooledConnection.
    SqliteHandle acquire();
    void release(SqliteHandle handle);

    void shutdown();
    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace docrag_core
