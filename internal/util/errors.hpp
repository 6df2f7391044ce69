#pragma once

#include <stdexcept>
#include <string>

namespace catalog::util {

/*
  Central error types.

  Everything below propagates to the caller of the collector, which owns
  the transaction and decides whether to roll back and retry.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage read/write failure. Fatal to the current attempt.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisted graph breaks an upstream invariant (malformed edge rows etc).
class IntegrityViolation : public std::runtime_error {
 public:
  explicit IntegrityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace catalog::util
