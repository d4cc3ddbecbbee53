#pragma once

#include <stdexcept>
#include <string>

namespace uuidcraft {

  // Base of every error thrown by the library
  class UuidError : public std::runtime_error {
  public:
    explicit UuidError(const std::string& message) : std::runtime_error(message) {}
  };

  // Clock sequence space exhausted for one timestamp tick
  class OverrunError : public UuidError {
  public:
    explicit OverrunError(const std::string& message) : UuidError(message) {}
  };

  // Call that a creator structurally does not support
  class UnsupportedOperationError : public UuidError {
  public:
    explicit UnsupportedOperationError(const std::string& message) : UuidError(message) {}
  };

  // Malformed UUID string, or field extraction on an incompatible version
  class InvalidFormatError : public UuidError {
  public:
    explicit InvalidFormatError(const std::string& message) : UuidError(message) {}
  };

  // Required value missing or out of range
  class InvalidArgumentError : public UuidError {
  public:
    explicit InvalidArgumentError(const std::string& message) : UuidError(message) {}
  };

}  // namespace uuidcraft
