#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace batch_core {

struct PoolOptions {
  int size = 4;
  std::chrono::milliseconds busy_timeout{5000};
};

// Fixed set of keyed connections shared by the repositories. Every connection
// is opened up front so a bad key fails construction instead of the first query.
class ConnectionPool {
 public:
  using Handle = std::unique_ptr<sqlite::database>;

  ConnectionPool(std::string db_path, std::string db_key, PoolOptions options);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Waits for an idle connection. Throws StoreError once the pool is closed.
  Handle acquire();

  // Connections released after close() are dropped.
  void release(Handle conn);

  // Wakes every waiter and closes idle connections.
  void close();

  std::size_t capacity() const;
  std::size_t idle() const;

  // Opens a single connection, applies the key and the session pragmas.
  // A key that does not match the file is reported as StoreError.
  static Handle open_keyed(const std::string& db_path, const std::string& db_key,
                           std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

 private:
  const std::string db_path_;
  const std::string db_key_;
  const PoolOptions options_;

  std::vector<Handle> idle_;
  bool closed_ = false;
  mutable std::mutex mtx_;
  std::condition_variable released_;
};

}  // namespace batch_core
