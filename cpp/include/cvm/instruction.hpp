// include/cvm/instruction.hpp
#pragma once
#include "bytes.hpp"
#include "hash.hpp"
#include "parse.hpp"
#include "registers.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cvm {

// `<source> into <destination>`, shared by every unary instruction.
class UnaryOperation {
public:
  UnaryOperation(Register source, Register destination) noexcept
      : source_(source), destination_(destination) {}

  static Parsed<UnaryOperation> parse(std::string_view in);
  // Byte layout: source locator u64 LE, destination locator u64 LE.
  static UnaryOperation read(ByteReader &in);
  void write(ByteWriter &out) const;

  const Register &source() const noexcept { return source_; }
  const Register &destination() const noexcept { return destination_; }

  std::string to_string() const;

  bool operator==(const UnaryOperation &rhs) const noexcept {
    return source_ == rhs.source_ && destination_ == rhs.destination_;
  }
  bool operator!=(const UnaryOperation &rhs) const noexcept {
    return !(*this == rhs);
  }

private:
  Register source_;
  Register destination_;
};

// Hashes the value in the source register into one field element in the
// destination register. `Hasher` is an empty functor recreated on every
// parse and decode.
template <typename Hasher> class HashInstruction {
public:
  explicit HashInstruction(UnaryOperation operation) noexcept
      : operation_(operation) {}

  static std::string_view opcode() noexcept;

  // `<opcode> <src> into <dst>;`
  static Parsed<HashInstruction> parse(std::string_view in);
  // Convenience for the bare operand form, e.g. "r0 into r1".
  static HashInstruction from_operands(std::string_view in);
  static HashInstruction read(ByteReader &in) {
    return HashInstruction(UnaryOperation::read(in));
  }
  void write(ByteWriter &out) const { operation_.write(out); }

  // Halts on an undefined source, an unhashable operand, or a destination
  // that is already defined.
  void evaluate(Registers &registers) const;

  const UnaryOperation &operation() const noexcept { return operation_; }
  std::string to_string() const;

  bool operator==(const HashInstruction &rhs) const noexcept {
    return operation_ == rhs.operation_;
  }
  bool operator!=(const HashInstruction &rhs) const noexcept {
    return !(*this == rhs);
  }

private:
  UnaryOperation operation_;
  Hasher hasher_{};
};

using HashPsd2 = HashInstruction<Poseidon2>;
using HashPsd4 = HashInstruction<Poseidon4>;
using HashPsd8 = HashInstruction<Poseidon8>;

template <> inline std::string_view HashPsd2::opcode() noexcept {
  return "hash.psd2";
}
template <> inline std::string_view HashPsd4::opcode() noexcept {
  return "hash.psd4";
}
template <> inline std::string_view HashPsd8::opcode() noexcept {
  return "hash.psd8";
}

extern template class HashInstruction<Poseidon2>;
extern template class HashInstruction<Poseidon4>;
extern template class HashInstruction<Poseidon8>;

// Closed set of instructions. The variant index doubles as the u16 tag that
// prefixes each encoded instruction.
class Instruction {
public:
  using Variant = std::variant<HashPsd2, HashPsd4, HashPsd8>;

  template <typename T,
            typename = std::enable_if_t<std::is_constructible<Variant, T>::value>>
  Instruction(T op) : op_(std::move(op)) {}

  // Dispatches on the leading opcode token.
  static Parsed<Instruction> parse(std::string_view in);
  // Reads the u16 tag, then the variant's own encoding.
  static Instruction read(ByteReader &in);
  void write(ByteWriter &out) const;

  std::uint16_t tag() const noexcept {
    return static_cast<std::uint16_t>(op_.index());
  }
  std::string_view opcode() const noexcept;
  const Register &destination() const noexcept;
  void evaluate(Registers &registers) const;
  std::string to_string() const;

  const Variant &variant() const noexcept { return op_; }

  bool operator==(const Instruction &rhs) const { return op_ == rhs.op_; }
  bool operator!=(const Instruction &rhs) const { return !(*this == rhs); }

private:
  Variant op_;
};

} // namespace cvm
