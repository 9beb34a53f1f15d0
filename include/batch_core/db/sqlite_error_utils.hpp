#pragma once

#include <string>

#include <sqlite_modern_cpp.h>

namespace batch_core {

// What went wrong at the SQLite level, reduced to the cases the task store
// reacts to differently.
enum class DbFailure {
  Busy,         // SQLITE_BUSY / SQLITE_LOCKED, another writer holds the file
  MissingTask,  // foreign key violation: the referenced task row is gone
  Constraint,   // any other CHECK / UNIQUE / NOT NULL violation
  WrongKey,     // SQLITE_NOTADB: the key does not decrypt the file
  Storage,      // I/O, full disk, read-only or unopenable file, corruption
  Other
};

std::string to_string(DbFailure failure);

DbFailure classify_db_failure(const sqlite::sqlite_exception& e);

// "<operation> failed: (<failure>) <sqlite message> [code=N, xcode=N]"
std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e);

}  // namespace batch_core
