#pragma once

#include <stdexcept>
#include <string>

namespace warden::util {

/*
  Central error types.

  Everything the entry points (Apply / Rollback / Recovery) raise derives
  from std::runtime_error; the CLI maps each to an exit code.
*/

// A pending attempt already exists for the same (name, version), or a
// concurrent writer moved the record first. Retry after backoff.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransitionError : public std::runtime_error {
 public:
  explicit InvalidTransitionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durability failure; the open transaction was rolled back.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by appliers; the state machine records it instead of propagating.
class ApplierError : public std::runtime_error {
 public:
  explicit ApplierError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace warden::util
