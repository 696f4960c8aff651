#pragma once

#include <string>
#include <utility>

namespace scavenger::db {

/*
  Backend-neutral outcome of a repository write.

  Backends map their native failures onto ErrorCode; the engine turns a
  failed Result into a util:: exception (see core::ThrowIfDbError).
*/
enum class ErrorCode {
  OK = 0,

  // the addressed waste unit or incentive row does not exist
  NotFound,
  // insert collided with an existing id
  AlreadyExists,
  // write would break a stored invariant (immutable column, budget bound)
  ConstraintViolation,

  Busy,
  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace scavenger::db
