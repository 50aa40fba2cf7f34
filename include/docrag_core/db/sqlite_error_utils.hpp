#pragma once

#include <string>

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include "docrag_core/errors.hpp"

namespace docrag_core {

// Coarse grouping of SQLite result codes as the collection store sees them.
enum class DbErrorKind {
  Contention,  // BUSY, LOCKED
  Constraint,
  ReadOnly,
  Storage,     // IOERR, FULL, CANTOPEN
  Corrupt,     // CORRUPT, NOTADB
  Schema,
  Other
};

inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Contention;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::ReadOnly;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return DbErrorKind::Storage;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Other;
  }
}

inline const char* kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Contention: return "contention";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::ReadOnly: return "readonly";
    case DbErrorKind::Storage: return "storage";
    case DbErrorKind::Corrupt: return "corrupt";
    case DbErrorKind::Schema: return "schema";
    case DbErrorKind::Other: break;
  }
  return "other";
}

// Contention clears on its own; a caller may retry the whole operation.
inline bool is_transient(DbErrorKind kind) { return kind == DbErrorKind::Contention; }

// "add failed: constraint (UNIQUE constraint failed: entries.id) [sqlite 2067]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const DbErrorKind kind = classify_sqlite_code(e.get_extended_code());
  std::string msg = operation + " failed: " + kind_to_string(kind) + " (" + e.errstr() +
                    ") [sqlite " + std::to_string(e.get_extended_code()) + "]";
  if (is_transient(kind)) {
    msg += ", retry later";
  }
  return msg;
}

inline BackendOperationError backend_error(const std::string& operation,
                                           const sqlite::sqlite_exception& e) {
  return BackendOperationError(format_db_error(operation, e));
}

inline BackendInitError backend_init_error(const std::string& operation,
                                           const sqlite::sqlite_exception& e) {
  return BackendInitError(format_db_error(operation, e));
}

}  // namespace docrag_core
