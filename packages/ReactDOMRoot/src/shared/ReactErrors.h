#pragma once

#include <stdexcept>
#include <string>

namespace reactdom {

// Thrown by the render step when a description names a type that is neither
// a host tag nor a function component.
class InvalidElementTypeError final : public std::invalid_argument {
 public:
  explicit InvalidElementTypeError(const std::string& got)
      : std::invalid_argument(
            "Element type is invalid: expected a string (for built-in components) or a function "
            "(for composite components) but got: " + got + ".") {}
};

// Thrown by a HostCommitAdapter that refuses to apply a tree to its container.
class HostCommitError final : public std::runtime_error {
 public:
  explicit HostCommitError(const std::string& message)
      : std::runtime_error(message) {}
};

} // namespace reactdom
