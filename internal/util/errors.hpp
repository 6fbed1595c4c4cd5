#pragma once

#include <stdexcept>
#include <string>

namespace trustmem::util {

/*
  Central error types.

  Everything the bank throws derives from std::runtime_error. Repository
  failures arrive as db::Result codes and are translated to StorageError or
  NotFound at the bank boundary.
*/

// Malformed producer output or policy values. Nothing has been persisted.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by the capture wrapper in strict mode after the flagged artifact was stored.
class ConstitutionalViolation : public std::runtime_error {
 public:
  ConstitutionalViolation(const std::string& msg, std::string reference)
      : std::runtime_error(msg), reference_(std::move(reference)) {
  }

  const std::string& reference() const {
    return reference_;
  }

 private:
  std::string reference_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable store failure. Retryable.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PolicyConflict : public std::runtime_error {
 public:
  explicit PolicyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace trustmem::util
