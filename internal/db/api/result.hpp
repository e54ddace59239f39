#pragma once

#include <string>
#include <utility>

namespace shortener::db {

// Backend-neutral outcome of a repository write. The code generator only
// branches on ConstraintViolation; every other failure is a store outage.

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  // unique index on short_code rejected the row
  ConstraintViolation,

  IOError,
  Corruption,

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

} // namespace shortener::db
