#pragma once

#include "docu_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docu_core {

// Owns the connection pool for one database file. Passed by reference to its users.
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_shut_down_ = false;
};

} // namespace docu_core
