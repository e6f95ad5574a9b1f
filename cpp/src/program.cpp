// src/program.cpp
#include "cvm/program.hpp"
#include "cvm/errors.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace cvm {
namespace {

std::size_t line_of(std::string_view whole, std::string_view at) {
  const std::size_t offset = whole.size() - at.size();
  return 1 + static_cast<std::size_t>(
                 std::count(whole.begin(), whole.begin() + offset, '\n'));
}

} // namespace

Program Program::parse(std::string_view whole) {
  std::vector<Instruction> out;
  std::string_view rest = text::skip_space_and_comments(whole);
  while (!rest.empty()) {
    try {
      Parsed<Instruction> p = Instruction::parse(rest);
      out.push_back(std::move(p.value));
      rest = text::skip_space_and_comments(p.rest);
    } catch (const ParseError &e) {
      throw ParseError("line " + std::to_string(line_of(whole, rest)) + ": " +
                       e.what());
    }
  }
  spdlog::debug("parsed program: {} instruction(s)", out.size());
  return Program(std::move(out));
}

Program Program::from_bytes(const std::vector<std::uint8_t> &bytes) {
  ByteReader in(bytes);
  const std::uint32_t count = in.read_u32();
  // Every instruction takes at least its u16 tag.
  if (count > in.remaining() / 2)
    throw DecodeError("instruction count " + std::to_string(count) +
                      " exceeds the input size");
  std::vector<Instruction> out;
  out.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i)
    out.push_back(Instruction::read(in));
  if (!in.at_end())
    throw DecodeError(std::to_string(in.remaining()) +
                      " trailing byte(s) after program");
  spdlog::debug("decoded program: {} instruction(s)", out.size());
  return Program(std::move(out));
}

std::vector<std::uint8_t> Program::to_bytes() const {
  if (instructions_.size() > std::numeric_limits<std::uint32_t>::max())
    throw std::length_error("program has too many instructions to encode");
  ByteWriter out;
  out.write_u32(static_cast<std::uint32_t>(instructions_.size()));
  for (const Instruction &i : instructions_)
    i.write(out);
  return out.take();
}

std::string Program::to_string() const {
  std::string out;
  for (const Instruction &i : instructions_) {
    out += i.to_string();
    out += '\n';
  }
  return out;
}

} // namespace cvm
