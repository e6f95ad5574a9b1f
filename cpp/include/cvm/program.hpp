// include/cvm/program.hpp
#pragma once
#include "instruction.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cvm {

// Ordered instruction list.
class Program {
public:
  Program() = default;
  explicit Program(std::vector<Instruction> instructions)
      : instructions_(std::move(instructions)) {}

  // Instructions separated by whitespace; `//` starts a line comment.
  // Throws cvm::ParseError prefixed with the 1-based line number.
  static Program parse(std::string_view in);

  // u32 LE instruction count, then each instruction. Trailing bytes are an
  // error. Throws cvm::DecodeError.
  static Program from_bytes(const std::vector<std::uint8_t> &bytes);
  std::vector<std::uint8_t> to_bytes() const;

  // One instruction per line.
  std::string to_string() const;

  const std::vector<Instruction> &instructions() const noexcept {
    return instructions_;
  }
  std::size_t size() const noexcept { return instructions_.size(); }

  bool operator==(const Program &rhs) const {
    return instructions_ == rhs.instructions_;
  }

private:
  std::vector<Instruction> instructions_;
};

} // namespace cvm
