#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "internal/util/errors.hpp"

namespace snapmig::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  ConnectionFailure,
  QueryFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Raises the util:: error matching a failed write result.

  Connection and query failures keep their category; everything else the
  target reports on a write is a WriteError.
*/
inline void ThrowIfError(const Result& result, std::string_view context) {
  if (result) {
    return;
  }

  std::string msg(context);
  if (!result.message.empty()) {
    msg += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::ConnectionFailure:
      throw util::ConnectionError(msg);
    case ErrorCode::QueryFailure:
      throw util::QueryError(msg);
    default:
      throw util::WriteError(msg);
  }
}

} // namespace snapmig::db
