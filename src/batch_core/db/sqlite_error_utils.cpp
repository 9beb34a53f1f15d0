#include "batch_core/db/sqlite_error_utils.hpp"

#include <sqlite3.h>

namespace batch_core {

std::string to_string(DbFailure failure) {
  switch (failure) {
    case DbFailure::Busy: return "busy";
    case DbFailure::MissingTask: return "missing_task";
    case DbFailure::Constraint: return "constraint";
    case DbFailure::WrongKey: return "wrong_key";
    case DbFailure::Storage: return "storage";
    case DbFailure::Other: return "other";
  }
  return "other";
}

DbFailure classify_db_failure(const sqlite::sqlite_exception& e) {
  if (e.get_extended_code() == SQLITE_CONSTRAINT_FOREIGNKEY) {
    return DbFailure::MissingTask;
  }
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbFailure::Busy;
    case SQLITE_CONSTRAINT:
      return DbFailure::Constraint;
    case SQLITE_NOTADB:
      return DbFailure::WrongKey;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_CANTOPEN:
    case SQLITE_CORRUPT:
      return DbFailure::Storage;
    default:
      return DbFailure::Other;
  }
}

std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed: (" + to_string(classify_db_failure(e)) + ") " + e.errstr() +
         " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace batch_core
