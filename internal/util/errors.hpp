#pragma once

#include <stdexcept>
#include <string>

namespace fleet::util {

/*
  Central error types.

  Invocation failures are normally carried inside ModuleCallResult;
  ThrowIfFailed() turns them into the exceptions below.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidPattern : public std::runtime_error {
 public:
  explicit InvalidPattern(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed module argument payload. Only the strict decoder throws it.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(const std::string& msg, std::string raw_output, int exit_code)
      : std::runtime_error(msg), raw_output_(std::move(raw_output)), exit_code_(exit_code) {
  }

  const std::string& raw_output() const {
    return raw_output_;
  }
  int exit_code() const {
    return exit_code_;
  }

 private:
  std::string raw_output_;
  int         exit_code_;
};

class TimeoutError : public std::runtime_error {
 public:
  TimeoutError(const std::string& msg, std::string partial_output)
      : std::runtime_error(msg), partial_output_(std::move(partial_output)) {
  }

  const std::string& partial_output() const {
    return partial_output_;
  }

 private:
  std::string partial_output_;
};

class InventoryCycleError : public std::runtime_error {
 public:
  explicit InventoryCycleError(const std::string& cycle)
      : std::runtime_error("group children cycle: " + cycle), cycle_(cycle) {
  }

  // e.g. "A -> B -> A"
  const std::string& cycle() const {
    return cycle_;
  }

 private:
  std::string cycle_;
};

class InventorySourceError : public std::runtime_error {
 public:
  InventorySourceError(const std::string& source, const std::string& msg)
      : std::runtime_error("inventory source " + source + ": " + msg), source_(source) {
  }

  const std::string& source() const {
    return source_;
  }

 private:
  std::string source_;
};

} // namespace fleet::util
