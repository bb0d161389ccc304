/* Exception types shared across the library. */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bactopo::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Truncated or structurally invalid BVLL/NPDU/APDU bytes.
struct DecodeError : public ValueError {
  using ValueError::ValueError;
};

// Socket level failure (send, bind, address resolution).
struct TransportError : public RuntimeError {
  using RuntimeError::RuntimeError;
};

// Invalid configuration value or document.
struct ConfigError : public ValueError {
  using ValueError::ValueError;
};

// Malformed snapshot text. line() is 1-based, 0 when unknown.
struct ParseError : public ValueError {
  ParseError(const std::string& what, std::size_t line)
      : ValueError("line " + std::to_string(line) + ": " + what), line_(line) {}
  [[nodiscard]] std::size_t line() const noexcept { return line_; }
private:
  std::size_t line_ {0};
};

} // namespace bactopo::core
