#pragma once
#include "docu_core/db/database_manager.hpp"
#include <sqlite_modern_cpp.h>
#include <memory>

namespace docu_core {
class PooledConnection {
public:
    // Borrows a connection from the manager's pool for the lifetime of this guard
    explicit PooledConnection(DatabaseManager& manager)
    : manager_(manager), conn_(manager.get_connection()) {}

    ~PooledConnection() {
        if (conn_) {
            manager_.return_connection(std::move(conn_));
        }
    }

    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

private:
    DatabaseManager& manager_;
    std::unique_ptr<sqlite::database> conn_;
};
}  // namespace docu_core
