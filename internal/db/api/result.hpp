#pragma once

#include <string>

namespace workgraph::db {

/*
  Outcome of a repository call, independent of the backend.

    NotFound            item or edge id is not stored
    AlreadyExists       id taken, or retired by an earlier delete
    ConstraintViolation dangling edge endpoint, or delete of a referenced item
    Conflict / Busy     lost a write race; the store retries the whole unit
    IOError / Corruption / InternalError
                        backend failure, surfaced as INTERNAL

  The store maps these to util exceptions; nothing above db/ sees sqlite codes.
*/

enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  ConstraintViolation,
  Conflict,
  Busy,
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

} // namespace workgraph::db
