#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <stdexcept>

#include "docvec_core/db/database_manager.hpp"

namespace docvec_core {

// Borrows one connection from the manager for the guard's scope and returns it on every exit path
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager) : manager_(manager) {
    try {
      conn_ = manager.get_connection();
    } catch (const std::runtime_error& e) {
      throw StoreConnectionError(std::string("No database connection available: ") + e.what());
    }
    if (!conn_) {
      throw StoreConnectionError("No database connection available: store is shutting down");
    }
  }

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

}  // namespace docvec_core
