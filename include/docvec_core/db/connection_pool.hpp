#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docvec_core {

/**
 * Fixed set of connections to one SQLite/SQLCipher file. Every connection is
 * opened, keyed (when a key is given) and probed in the constructor, so a
 * wrong key or unreadable file fails here rather than on first use.
 * get_connection() blocks while all connections are borrowed.
 */
class ConnectionPool {
 public:
  // Throws sqlite::sqlite_exception or std::runtime_error if any connection cannot be opened
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  // Drops idle connections and wakes blocked borrowers, which then throw
  void shutdown();

 private:
  std::unique_ptr<sqlite::database> open_connection() const;

  std::string db_path_;
  std::string db_key_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docvec_core
