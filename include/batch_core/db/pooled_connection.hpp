#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

namespace batch_core {

class ConnectionPool;
class DatabaseManager;

// Scoped checkout of one pooled connection. The guard keeps the pool it
// borrowed from, so a connection outliving a shutdown never lands in a newer pool.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager);
  ~PooledConnection();

  PooledConnection(PooledConnection&& other) noexcept;
  PooledConnection& operator=(PooledConnection&& other) noexcept;

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& get() const { return *conn_; }
  sqlite::database* operator->() const { return conn_.get(); }
  sqlite::database& operator*() const { return *conn_; }

 private:
  void give_back() noexcept;

  std::shared_ptr<ConnectionPool> pool_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace batch_core
