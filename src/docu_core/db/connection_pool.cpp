#include <sqlcipher/sqlite3.h>

#include "docu_core/db/connection_pool.hpp"
#include "docu_core/db/sqlite_error_utils.hpp"
#include "docu_core/errors.hpp"

namespace docu_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string& db_path,
                                                                  const std::string& db_key) {
  try {
    auto db = std::make_unique<sqlite::database>(db_path);
    sqlite3* handle = db->connection().get();
    if (!handle) {
      throw VectorStoreError("No native handle for connection to " + db_path);
    }

    if (!db_key.empty() &&
        sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
      throw VectorStoreError("Failed to key database connection: " +
                             std::string(sqlite3_errmsg(handle)));
    }

    // SQLCipher only checks the key on first read
    *db << "SELECT count(*) FROM sqlite_master;";
    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA busy_timeout = 5000;";
    return db;
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("open_connection", e);
  }
}

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), capacity_(pool_size) {
  if (pool_size <= 0) {
    throw VectorStoreError("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    idle_.push(open_connection(db_path_, db_key));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });
  if (shutting_down_) {
    throw VectorStoreError("Connection pool for " + db_path_ + " is shut down");
  }

  auto conn = std::move(idle_.front());
  idle_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_) {
      // Dropped here; the connection closes with its unique_ptr
      return;
    }
    idle_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(idle_);
  }
  cv_.notify_all();
}

}  // namespace docu_core
