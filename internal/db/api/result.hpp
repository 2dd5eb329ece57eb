#pragma once

#include <stdexcept>
#include <string>

namespace pgshadow::db {

/*
  Portable DB result codes.

  The postgres layer translates libpqxx exceptions and SQLSTATEs into these.
  Engines above it decide retry / abort / fail from the code alone.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  // retryable
  SerializationFailure,
  Deadlock,
  LockTimeout,
  ConnectionLost,
  Busy,

  PermissionDenied,
  ConstraintViolation,
  InvalidInput,
  Cancelled,

  InternalError
};

constexpr bool IsTransient(ErrorCode code) {
  switch (code) {
    case ErrorCode::SerializationFailure:
    case ErrorCode::Deadlock:
    case ErrorCode::LockTimeout:
    case ErrorCode::ConnectionLost:
    case ErrorCode::Busy:
      return true;
    default:
      return false;
  }
}

constexpr const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Deadlock:
      return "deadlock";
    case ErrorCode::LockTimeout:
      return "lock_timeout";
    case ErrorCode::ConnectionLost:
      return "connection_lost";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::PermissionDenied:
      return "permission_denied";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::InvalidInput:
      return "invalid_input";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
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

// Thrown where a Result has to cross a layer that only speaks exceptions.
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

} // namespace pgshadow::db
