#pragma once

#include <stdexcept>
#include <string>

namespace batch_core {

class BatchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed submission or config patch. Raised before anything is written.
class ValidationError : public BatchError {
 public:
  using BatchError::BatchError;
};

class NotFoundError : public BatchError {
 public:
  explicit NotFoundError(long long task_id)
      : BatchError("Task " + std::to_string(task_id) + " not found"), task_id_(task_id) {}

  long long task_id() const {
    return task_id_;
  }

 private:
  long long task_id_;
};

// Persistence failure. Repositories throw subclasses of this.
class StoreError : public BatchError {
 public:
  using BatchError::BatchError;
};

}  // namespace batch_core
