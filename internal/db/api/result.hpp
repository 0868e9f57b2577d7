#pragma once

#include <string>
#include <string_view>

namespace mediaflow::db {

// Backend-neutral outcome of a document store call. sqlite codes never cross this boundary.
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  InvalidArgument,
  Busy,

  ConstraintViolation,

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
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "internal";
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

} // namespace mediaflow::db
