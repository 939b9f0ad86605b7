#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "docvec_core/db/connection_pool.hpp"

#include <stdexcept>

namespace docvec_core {

namespace {

void apply_key(sqlite3* handle, const std::string& db_key) {
  if (db_key.empty())
    return;
  const int rc = sqlite3_key(handle, db_key.data(), static_cast<int>(db_key.size()));
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite3_key failed: " + std::string(sqlite3_errmsg(handle)));
  }
}

}  // namespace

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size < 1) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  while (static_cast<int>(pool_.size()) < pool_size) {
    pool_.push(open_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  sqlite3* handle = db->connection().get();
  if (handle == nullptr) {
    throw std::runtime_error("SQLite returned no native handle for " + db_path_);
  }
  apply_key(handle, db_key_);

  // The key is only checked on first read; a wrong key or a non-database file fails here
  int table_count = 0;
  *db << "SELECT count(*) FROM sqlite_master;" >> table_count;

  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });
  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  auto conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_)
      return;
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(pool_);
  }
  cv_.notify_all();
}

}  // namespace docvec_core
