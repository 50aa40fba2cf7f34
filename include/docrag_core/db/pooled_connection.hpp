#pragma once

#include "docrag_core/db/database_manager.hpp"

namespace docrag_core {

// Leases one handle from a DatabaseManager for the lifetime of the object.
class PooledConnection {
public:
    explicit PooledConnection(DatabaseManager& manager)
        : manager_(manager), handle_(manager.acquire()) {}

    ~PooledConnection() { manager_.release(std::move(handle_)); }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    sqlite::database& operator*() const { return *handle_; }
    sqlite::database* operator->() const { return handle_.get(); }

private:
    DatabaseManager& manager_;
    SqliteHandle handle_;
};

}  // namespace docrag_core
