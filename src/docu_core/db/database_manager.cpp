#include "docu_core/db/database_manager.hpp"

#include <spdlog/spdlog.h>

#include "docu_core/errors.hpp"

namespace docu_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path) {
  try {
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw VectorStoreError("Failed to create database directory: " + std::string(e.what()));
  }

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);
  spdlog::debug("Opened database {} with {} pooled connections", db_path.string(), pool_->capacity());
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw VectorStoreError("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

}  // namespace docu_core
