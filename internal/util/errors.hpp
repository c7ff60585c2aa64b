#pragma once

#include <stdexcept>
#include <string>

namespace workgraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Rejected input: dangling edge, unknown enum spelling, deleting a referenced item.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An index mutation failed and was rolled back. Caller retries or rebuilds.
class IndexInconsistent : public std::runtime_error {
 public:
  explicit IndexInconsistent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace workgraph::util
