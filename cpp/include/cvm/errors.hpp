// include/cvm/errors.hpp
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace cvm {

// Malformed program text. Recoverable: the caller decides what to do.
class ParseError : public std::invalid_argument {
public:
  explicit ParseError(const std::string &what) : std::invalid_argument(what) {}
};

// Truncated or malformed byte stream.
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

// Fatal evaluation failure. Aborts the whole program, never recovered by an
// instruction.
class Halt : public std::runtime_error {
public:
  explicit Halt(const std::string &what) : std::runtime_error(what) {}
};

// Logs `message` at error level and throws cvm::Halt.
[[noreturn]] void halt(const std::string &message);

} // namespace cvm
