#pragma once

#include <string>
#include <vector>

#include <sqlite_modern_cpp.h>

#include "batch_core/errors.hpp"

namespace batch_core {

class MigrationError : public StoreError {
 public:
  using StoreError::StoreError;
};

// One schema version. Statements run in order inside a single transaction,
// one statement per string.
struct Migration {
  int version;
  std::string description;
  std::vector<std::string> statements;
};

const std::vector<Migration> &all_migrations();

// Highest applied version, 0 for a fresh database.
int current_version(sqlite::database &db);

// Applies every migration newer than current_version(). Returns how many ran.
int run_migrations(sqlite::database &db);

}  // namespace batch_core
