#pragma once

#include "docvec_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docvec_core {

// The store could not be reached: missing directory, unreadable file, wrong key
class StoreConnectionError : public std::exception {
 public:
  explicit StoreConnectionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Owns the connections to one database file for the lifetime of a pipeline
 * run. Connections are opened (and keyed, when a key is given) eagerly in
 * the constructor so an unreachable store fails before any work starts, and
 * are all released when the manager is destroyed.
 */
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size = 1);
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
    bool is_initialized_ = false;
};

} // namespace docvec_core
