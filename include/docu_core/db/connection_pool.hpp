#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docu_core {

/**
 * @brief Fixed set of keyed SQLCipher connections to one database file.
 *
 * Every connection is opened, keyed and switched to WAL mode up front, so a
 * wrong key fails at construction. Borrowers block until a connection is
 * returned; shutdown() wakes them with a VectorStoreError.
 */
class ConnectionPool {
 public:
  // An empty db_key opens the database unencrypted
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  int capacity() const {
    return capacity_;
  }

  static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path,
                                                           const std::string& db_key);

 private:
  std::string db_path_;
  int capacity_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docu_core
