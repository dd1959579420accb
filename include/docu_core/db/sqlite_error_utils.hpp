#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "docu_core/errors.hpp"

namespace docu_core {

// Coarse SQLite failure classes, keyed on the primary result code
enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, NotADatabase, Generic };

inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
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
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    case SQLITE_NOTADB:
      // SQLCipher reports a wrong key this way
      return DbErrorKind::NotADatabase;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::Schema: return "schema";
    case DbErrorKind::NotADatabase: return "notadb";
    case DbErrorKind::Generic: return "generic";
  }
  return "generic";
}

/**
 * Wraps a sqlite_modern_cpp failure as a VectorStoreError:
 * "<operation> failed: (<kind>) <message> in '<sql>' [code=.., xcode=..]"
 */
inline VectorStoreError db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const DbErrorKind kind = classify_sqlite_code(e.get_code());
  std::string message = operation + " failed: (" + to_string(kind) + ") " + e.what();
  if (!e.get_sql().empty()) {
    message += " in '" + e.get_sql() + "'";
  }
  message += " [code=" + std::to_string(e.get_code()) +
             ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return VectorStoreError(message);
}

}  // namespace docu_core
