#pragma once

#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace snapmig::db::postgres {

/*
  pqxx exception -> portable error mapping.

  Writes report a Result; reads and cursors throw the util:: type.
*/

inline Result TranslateWriteError(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::ConnectionFailure, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::sql_error*>(&e)) {
    return Result::Err(ErrorCode::QueryFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

[[noreturn]] inline void ThrowReadError(const std::exception& e, const std::string& what) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    throw util::ConnectionError(what + ": " + e.what());
  }
  throw util::QueryError(what + ": " + e.what());
}

} // namespace snapmig::db::postgres
