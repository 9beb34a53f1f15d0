#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "batch_core/db/connection_pool.hpp"

#include <stdexcept>
#include <utility>

#include "batch_core/db/sqlite_error_utils.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

namespace {

const char* const kSessionPragmas[] = {
    "PRAGMA foreign_keys = ON;",
    "PRAGMA journal_mode = WAL;",
    "PRAGMA synchronous = NORMAL;",
};

}  // namespace

ConnectionPool::Handle ConnectionPool::open_keyed(const std::string& db_path,
                                                  const std::string& db_key,
                                                  std::chrono::milliseconds busy_timeout) {
  Handle db;
  try {
    db = std::make_unique<sqlite::database>(db_path);
  } catch (const sqlite::sqlite_exception& e) {
    throw StoreError(format_db_error("open " + db_path, e));
  }

  sqlite3* handle = db->connection().get();
  if (sqlite3_key(handle, db_key.data(), static_cast<int>(db_key.size())) != SQLITE_OK) {
    throw StoreError("Could not apply key to " + db_path + ": " + sqlite3_errmsg(handle));
  }
  sqlite3_busy_timeout(handle, static_cast<int>(busy_timeout.count()));

  try {
    // The first read is where SQLCipher notices a wrong key
    int tables = 0;
    *db << "SELECT count(*) FROM sqlite_master;" >> tables;
    for (const char* pragma : kSessionPragmas) {
      *db << pragma;
    }
  } catch (const sqlite::sqlite_exception& e) {
    if (classify_db_failure(e) == DbFailure::WrongKey) {
      throw StoreError("Database key does not match " + db_path);
    }
    throw StoreError(format_db_error("configure " + db_path, e));
  }
  return db;
}

ConnectionPool::ConnectionPool(std::string db_path, std::string db_key, PoolOptions options)
    : db_path_(std::move(db_path)), db_key_(std::move(db_key)), options_(options) {
  if (options_.size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive, got " +
                                std::to_string(options_.size));
  }
  idle_.reserve(static_cast<std::size_t>(options_.size));
  for (int i = 0; i < options_.size; ++i) {
    idle_.push_back(open_keyed(db_path_, db_key_, options_.busy_timeout));
  }
}

ConnectionPool::~ConnectionPool() {
  close();
}

ConnectionPool::Handle ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mtx_);
  released_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw StoreError("Connection pool for " + db_path_ + " is closed");
  }

  // Most recently released first, its page cache is warm
  Handle conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::release(Handle conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  released_.notify_one();
}

void ConnectionPool::close() {
  std::vector<Handle> dropped;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    dropped.swap(idle_);
  }
  released_.notify_all();
}

std::size_t ConnectionPool::capacity() const {
  return static_cast<std::size_t>(options_.size);
}

std::size_t ConnectionPool::idle() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace batch_core
