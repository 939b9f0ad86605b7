#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docvec_core {

enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  NotADatabase,
  Full,
  Schema,
  Generic
};

inline DbErrorKind classify_db_error(const sqlite::sqlite_exception& e) {
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

// A later run against the same store may succeed without intervention
inline bool is_transient(DbErrorKind kind) {
  return kind == DbErrorKind::BusyOrLocked || kind == DbErrorKind::Io;
}

inline const char* to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::NotADatabase: return "notadb (wrong key or not a database)";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::Schema: return "schema";
    default: return "generic";
  }
}

// "<operation> failed: (<kind>) <sqlite message> [code=.., xcode=..]", plus a retry hint
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const DbErrorKind kind = classify_db_error(e);
  std::string msg = operation + " failed: (" + to_string(kind) + ") " + e.errstr();
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  if (is_transient(kind)) {
    msg += "; the store was busy, retrying the run may succeed";
  }
  return msg;
}

} // namespace docvec_core
