#pragma once

#include "util/Exception.hpp"

#include <cstdint>

namespace bzero {

// Invalid configuration value. Derives from CleanException: main() reports it without a backtrace.
class ConfigError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// An operation was attempted in a state that cannot support it, e.g. sampling an empty buffer.
class InvalidStateError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A client sent a malformed or out-of-range request.
class ProtocolError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// Codes carried in "status" and "error" replies.
enum class StatusCode : int8_t {
  kOk = 0,
  kProtocolError = 1,
  kInvalidState = 2,
  kInternalError = 3
};

}  // namespace bzero
