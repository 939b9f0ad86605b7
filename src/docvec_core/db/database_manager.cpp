#include "docvec_core/db/database_manager.hpp"

#include "docvec_core/db/sqlite_error_utils.hpp"

#include <stdexcept>
#include <system_error>

namespace docvec_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path) {
  try {
    // Ensure parent directory exists
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreConnectionError("Could not prepare database directory for " + db_path.string() +
                               ": " + e.what());
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreConnectionError("Could not connect to the database at " + db_path.string() + ": " +
                               format_db_error("open", e));
  } catch (const std::runtime_error& e) {
    throw StoreConnectionError("Could not connect to the database at " + db_path.string() + ": " +
                               e.what());
  }

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

}  // namespace docvec_core
