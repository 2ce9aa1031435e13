#pragma once

#include <string>
#include <string_view>

namespace relations::db {

/*
  Outcome of a repository write.

  Backends translate sqlite3 / pqxx failures into these codes; nothing above
  internal/db sees a backend error type.

    NotFound             event, edge or annotation group absent
    AlreadyExists        duplicate event id or relation edge
    ConstraintViolation  foreign key or check failure (edge to a missing event)
    Busy                 SQLITE_BUSY after the busy timeout
    SerializationFailure concurrent counter update lost (Postgres 40001)
    IOError / Corruption storage layer failure
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  Busy,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal_error";
}

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

} // namespace relations::db
