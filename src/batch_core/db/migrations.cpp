#include "batch_core/db/migrations.hpp"

#include <iostream>

#include "batch_core/db/sqlite_error_utils.hpp"
#include "batch_core/db/time_utils.hpp"
#include "batch_core/db/transaction.hpp"

namespace batch_core {

const std::vector<Migration> &all_migrations() {
  static const std::vector<Migration> migrations = {
      {1,
       "initial schema",
       {
           R"(
      CREATE TABLE IF NOT EXISTS tasks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          type TEXT NOT NULL,
          name TEXT NOT NULL DEFAULT '',
          status TEXT NOT NULL DEFAULT 'pending',
          priority INTEGER NOT NULL DEFAULT 0,
          created_at INTEGER NOT NULL,
          updated_at INTEGER NOT NULL,
          started_at INTEGER,
          completed_at INTEGER,
          execution_time INTEGER NOT NULL DEFAULT 0,
          output_dir TEXT NOT NULL,
          params TEXT NOT NULL DEFAULT '{}',
          progress INTEGER NOT NULL DEFAULT 0,
          current_step TEXT,
          retry_count INTEGER NOT NULL DEFAULT 0,
          max_retry INTEGER NOT NULL DEFAULT 3,
          error_code TEXT,
          error_message TEXT,
          error_stack TEXT,
          CHECK (status IN ('pending', 'queued', 'running', 'paused', 'completed', 'failed', 'cancelled')),
          CHECK (progress >= 0 AND progress <= 100)
      )
    )",
           R"(
      CREATE TABLE IF NOT EXISTS task_files (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_id INTEGER NOT NULL,
          path TEXT NOT NULL,
          category TEXT NOT NULL DEFAULT '',
          category_label TEXT NOT NULL DEFAULT '',
          sort_order INTEGER NOT NULL DEFAULT 0,
          FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
      )
    )",
           R"(
      CREATE TABLE IF NOT EXISTS task_outputs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_id INTEGER NOT NULL,
          path TEXT NOT NULL,
          type TEXT NOT NULL DEFAULT 'other',
          size INTEGER,
          created_at INTEGER NOT NULL,
          FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
      )
    )",
           R"(
      CREATE TABLE IF NOT EXISTS task_logs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_id INTEGER NOT NULL,
          timestamp INTEGER NOT NULL,
          level TEXT NOT NULL DEFAULT 'info',
          message TEXT NOT NULL,
          raw TEXT,
          FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE,
          CHECK (level IN ('info', 'warning', 'error', 'success', 'debug'))
      )
    )",
           R"(
      CREATE TABLE IF NOT EXISTS config (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL,
          updated_at INTEGER NOT NULL
      )
    )",
           "CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status)",
           "CREATE INDEX IF NOT EXISTS idx_tasks_type ON tasks(type)",
           "CREATE INDEX IF NOT EXISTS idx_tasks_created_at ON tasks(created_at)",
           "CREATE INDEX IF NOT EXISTS idx_tasks_priority ON tasks(priority)",
           "CREATE INDEX IF NOT EXISTS idx_task_files_task_id ON task_files(task_id)",
           "CREATE INDEX IF NOT EXISTS idx_task_outputs_task_id ON task_outputs(task_id)",
           "CREATE INDEX IF NOT EXISTS idx_task_logs_task_id ON task_logs(task_id)",
           "CREATE INDEX IF NOT EXISTS idx_task_logs_timestamp ON task_logs(timestamp)",
       }},
      {2,
       "worker process binding",
       {
           "ALTER TABLE tasks ADD COLUMN pid INTEGER",
           "ALTER TABLE tasks ADD COLUMN pid_started_at INTEGER",
       }},
  };
  return migrations;
}

namespace {

void ensure_version_table(sqlite::database &db) {
  db << R"(
      CREATE TABLE IF NOT EXISTS schema_version (
          version INTEGER PRIMARY KEY,
          applied_at INTEGER NOT NULL,
          description TEXT
      )
    )";
}

}  // namespace

int current_version(sqlite::database &db) {
  try {
    ensure_version_table(db);
    int version = 0;
    db << "SELECT COALESCE(MAX(version), 0) FROM schema_version" >> version;
    return version;
  } catch (const sqlite::sqlite_exception &e) {
    throw MigrationError(format_db_error("current_version", e));
  }
}

int run_migrations(sqlite::database &db) {
  const int from = current_version(db);
  int applied = 0;

  for (const auto &migration : all_migrations()) {
    if (migration.version <= from) {
      continue;
    }
    try {
      Transaction tx(db, "migration v" + std::to_string(migration.version));
      for (const auto &statement : migration.statements) {
        db << statement;
      }
      db << "INSERT INTO schema_version (version, applied_at, description) VALUES (?, ?, ?)"
         << migration.version << now_millis() << migration.description;
      tx.commit();
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "[Migrations] v" << migration.version << " failed" << std::endl;
      throw MigrationError(format_db_error("migration v" + std::to_string(migration.version), e));
    }
    std::cout << "[Migrations] v" << migration.version << " " << migration.description
              << " applied" << std::endl;
    ++applied;
  }
  return applied;
}

}  // namespace batch_core
