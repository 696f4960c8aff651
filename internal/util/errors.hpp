#pragma once

#include <stdexcept>
#include <string>

namespace scavenger::util {

/*
  Central error types.

  Every engine call fails with exactly one of these. The CLI host maps them
  to exit codes; library callers branch on the type.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBudget : public std::runtime_error {
 public:
  explicit InsufficientBudget(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Overflow : public std::runtime_error {
 public:
  explicit Overflow(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace scavenger::util
