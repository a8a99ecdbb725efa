#pragma once

#include <stdexcept>
#include <string>

namespace snapmig::util {

/*
  Central error types.

  Every fatal condition of a migration run is one of these. The
  orchestrator never recovers them; they surface through the run's
  completion future unchanged.
*/

class MigrationError : public std::runtime_error {
 public:
  explicit MigrationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Source or target database unreachable.
class ConnectionError : public MigrationError {
 public:
  explicit ConnectionError(const std::string& msg) : MigrationError(msg) {
  }
};

// Malformed query, missing table or column.
class QueryError : public MigrationError {
 public:
  explicit QueryError(const std::string& msg) : MigrationError(msg) {
  }
};

// Unregistered serializer or payload bytes that do not match the scheme.
class DeserializationError : public MigrationError {
 public:
  explicit DeserializationError(const std::string& msg) : MigrationError(msg) {
  }
};

// Constraint violation on the target (duplicate key in strict full mode).
class WriteError : public MigrationError {
 public:
  explicit WriteError(const std::string& msg) : MigrationError(msg) {
  }
};

class InvalidState : public MigrationError {
 public:
  explicit InvalidState(const std::string& msg) : MigrationError(msg) {
  }
};

class MigrationCancelled : public MigrationError {
 public:
  explicit MigrationCancelled(const std::string& msg) : MigrationError(msg) {
  }
};

} // namespace snapmig::util
