#pragma once

#include <string>
#include <utility>

namespace twingraph::graph {

/*
  Portable store result codes.

  GraphStore implementations translate engine errors into these.
  The entity services map them onto util:: exceptions; nothing above
  the store sees pqxx error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  // conditional write lost against a concurrent writer
  Conflict,

  // engine refused the write: live edges, unique index
  ConstraintViolation,

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

} // namespace twingraph::graph
