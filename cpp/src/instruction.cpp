// src/instruction.cpp
#include "cvm/instruction.hpp"
#include "cvm/errors.hpp"
#include "cvm/fields.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace cvm {

// ---- UnaryOperation ----

Parsed<UnaryOperation> UnaryOperation::parse(std::string_view in) {
  Parsed<Register> src = Register::parse(in);
  std::string_view rest = text::expect_space(src.rest);
  rest = text::expect_keyword(rest, "into");
  rest = text::expect_space(rest);
  Parsed<Register> dst = Register::parse(rest);
  return {UnaryOperation(src.value, dst.value), dst.rest};
}

UnaryOperation UnaryOperation::read(ByteReader &in) {
  const Register src = Register::read(in);
  const Register dst = Register::read(in);
  return UnaryOperation(src, dst);
}

void UnaryOperation::write(ByteWriter &out) const {
  source_.write(out);
  destination_.write(out);
}

std::string UnaryOperation::to_string() const {
  return source_.to_string() + " into " + destination_.to_string();
}

// ---- HashInstruction ----

template <typename Hasher>
Parsed<HashInstruction<Hasher>>
HashInstruction<Hasher>::parse(std::string_view in) {
  std::string_view rest = text::expect_keyword(in, opcode());
  rest = text::expect_space(rest);
  Parsed<UnaryOperation> op = UnaryOperation::parse(rest);
  rest = text::expect(text::skip_space(op.rest), ";");
  return {HashInstruction(op.value), rest};
}

template <typename Hasher>
HashInstruction<Hasher>
HashInstruction<Hasher>::from_operands(std::string_view in) {
  Parsed<UnaryOperation> op = UnaryOperation::parse(text::skip_space(in));
  if (!text::skip_space(op.rest).empty())
    throw ParseError("trailing input after operands " + text::near(op.rest));
  return HashInstruction(op.value);
}

template <typename Hasher>
void HashInstruction<Hasher>::evaluate(Registers &registers) const {
  const Value &input = registers.load(operation_.source());

  std::optional<FlattenedValue> flat = to_fields(input);
  if (!flat)
    halt("Invalid '" + std::string(opcode()) + "' instruction");

  Field digest = hasher_.hash(flat->fields);
  if (spdlog::should_log(spdlog::level::trace))
    spdlog::trace("{}: {} element(s) -> {}", to_string(), flat->fields.size(),
                  digest.to_string());
  registers.assign(operation_.destination(),
                   Value(Literal::field(std::move(digest), flat->mode)));
}

template <typename Hasher>
std::string HashInstruction<Hasher>::to_string() const {
  return std::string(opcode()) + " " + operation_.to_string() + ";";
}

template class HashInstruction<Poseidon2>;
template class HashInstruction<Poseidon4>;
template class HashInstruction<Poseidon8>;

// ---- Instruction ----

namespace {

struct Entry {
  std::string_view (*opcode)() noexcept;
  Parsed<Instruction> (*parse)(std::string_view);
  Instruction (*read)(ByteReader &);
};

template <typename T> Entry make_entry() {
  return Entry{
      &T::opcode,
      [](std::string_view in) -> Parsed<Instruction> {
        Parsed<T> p = T::parse(in);
        return {Instruction(std::move(p.value)), p.rest};
      },
      [](ByteReader &in) -> Instruction { return Instruction(T::read(in)); },
  };
}

template <std::size_t... I>
std::array<Entry, sizeof...(I)> make_table(std::index_sequence<I...>) {
  return {make_entry<std::variant_alternative_t<I, Instruction::Variant>>()...};
}

// Position in the table is the encoded tag.
const std::array<Entry, std::variant_size<Instruction::Variant>::value> &
instruction_set() {
  static const auto table = make_table(
      std::make_index_sequence<std::variant_size<Instruction::Variant>::value>{});
  return table;
}

} // namespace

Parsed<Instruction> Instruction::parse(std::string_view in) {
  const std::string_view token = text::word(in);
  for (const Entry &e : instruction_set())
    if (token == e.opcode())
      return e.parse(in);
  throw ParseError("unknown opcode " + text::near(in));
}

Instruction Instruction::read(ByteReader &in) {
  const std::uint16_t tag = in.read_u16();
  if (tag >= instruction_set().size())
    throw DecodeError("unknown instruction tag " + std::to_string(tag));
  return instruction_set()[tag].read(in);
}

void Instruction::write(ByteWriter &out) const {
  out.write_u16(tag());
  std::visit([&](const auto &op) { op.write(out); }, op_);
}

std::string_view Instruction::opcode() const noexcept {
  return instruction_set()[op_.index()].opcode();
}

const Register &Instruction::destination() const noexcept {
  return std::visit(
      [](const auto &op) -> const Register & {
        return op.operation().destination();
      },
      op_);
}

void Instruction::evaluate(Registers &registers) const {
  std::visit([&](const auto &op) { op.evaluate(registers); }, op_);
}

std::string Instruction::to_string() const {
  return std::visit([](const auto &op) { return op.to_string(); }, op_);
}

} // namespace cvm
