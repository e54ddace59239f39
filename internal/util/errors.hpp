#pragma once

#include <stdexcept>
#include <string>

namespace shortener::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Caller supplied a blank or malformed URL / short code.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Allocation gave up: retry ceiling reached or code space exhausted.
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Cache tier or durable store failed. Never reported as NotFound.
class DependencyUnavailable : public std::runtime_error {
 public:
  explicit DependencyUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shortener::util
