#pragma once

#include <string>

namespace modstore::db {

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

// Converts a failed Result into the matching util exception.
void ThrowIfError(const Result& result, const std::string& context);

// True for codes a caller should retry later.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure ||
         code == ErrorCode::IOError;
}

} // namespace modstore::db
