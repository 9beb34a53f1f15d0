#include "batch_core/db/pooled_connection.hpp"

#include <utility>

#include "batch_core/db/connection_pool.hpp"
#include "batch_core/db/database_manager.hpp"

namespace batch_core {

PooledConnection::PooledConnection(DatabaseManager& manager)
    : pool_(manager.current_pool()), conn_(pool_->acquire()) {}

PooledConnection::~PooledConnection() {
  give_back();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(std::move(other.pool_)), conn_(std::move(other.conn_)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
  if (this != &other) {
    give_back();
    pool_ = std::move(other.pool_);
    conn_ = std::move(other.conn_);
  }
  return *this;
}

void PooledConnection::give_back() noexcept {
  if (conn_) {
    pool_->release(std::move(conn_));
  }
}

}  // namespace batch_core
