#pragma once

#include <stdexcept>
#include <string>

namespace pgcdc::util {

/*
  Central error types.

  Nothing below is retried internally; callers decide whether a session
  survives.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A data message referenced a relation that was never announced.
class ProtocolOrderingError : public NotFound {
 public:
  explicit ProtocolOrderingError(const std::string& msg) : NotFound(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& cause) : std::runtime_error(cause) {
  }
};

class UpstreamError : public std::runtime_error {
 public:
  explicit UpstreamError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pgcdc::util
