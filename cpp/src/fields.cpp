// src/fields.cpp
#include "cvm/fields.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace cvm {
namespace {

// Central allow-list, indexed by LiteralType.
constexpr std::array<FieldEncoding, kLiteralTypeCount> kEncodings = {
    FieldEncoding::Unsupported, // address
    FieldEncoding::Unsupported, // boolean
    FieldEncoding::Native,      // field
    FieldEncoding::Unsupported, // group
    FieldEncoding::Integer,     // i8
    FieldEncoding::Integer,     // i16
    FieldEncoding::Integer,     // i32
    FieldEncoding::Integer,     // i64
    FieldEncoding::Integer,     // i128
    FieldEncoding::Integer,     // u8
    FieldEncoding::Integer,     // u16
    FieldEncoding::Integer,     // u32
    FieldEncoding::Integer,     // u64
    FieldEncoding::Integer,     // u128
    FieldEncoding::Scalar,      // scalar
    FieldEncoding::PackedBytes, // string
};

Field integer_to_field(__uint128_t bits) {
  std::vector<std::uint8_t> bytes(16);
  for (std::size_t i = 0; i < bytes.size(); ++i)
    bytes[i] = static_cast<std::uint8_t>(bits >> (8 * i));
  return Field::from_bytes_le_mod_order(bytes);
}

std::vector<Field> pack_bytes(const std::string &s) {
  std::vector<bool> bits;
  bits.reserve(s.size() * 8);
  for (unsigned char c : s)
    for (int b = 0; b < 8; ++b)
      bits.push_back(((c >> b) & 1u) != 0);

  std::vector<Field> out;
  for (std::size_t at = 0; at < bits.size(); at += Field::kDataBits) {
    const std::size_t end = std::min(at + Field::kDataBits, bits.size());
    out.push_back(Field::from_bits_le(
        std::vector<bool>(bits.begin() + at, bits.begin() + end)));
  }
  return out;
}

bool flatten_into(const Value &value, FlattenedValue &out) {
  if (value.is_literal()) {
    std::optional<std::vector<Field>> fields = to_fields(value.literal());
    if (!fields)
      return false;
    for (Field &f : *fields)
      out.fields.push_back(std::move(f));
    out.mode = join(out.mode, value.literal().mode());
    return true;
  }
  for (const Value &member : value.composite().members)
    if (!flatten_into(member, out))
      return false;
  return true;
}

} // namespace

FieldEncoding field_encoding(LiteralType t) noexcept {
  return kEncodings[static_cast<std::size_t>(t)];
}

std::optional<std::vector<Field>> to_fields(const Literal &literal) {
  switch (field_encoding(literal.type())) {
  case FieldEncoding::Native:
  case FieldEncoding::Scalar:
    return std::vector<Field>{literal.field_value()};
  case FieldEncoding::Integer:
    return std::vector<Field>{integer_to_field(literal.integer_bits())};
  case FieldEncoding::PackedBytes:
    return pack_bytes(literal.text());
  case FieldEncoding::Unsupported:
    break;
  }
  return std::nullopt;
}

std::optional<FlattenedValue> to_fields(const Value &value) {
  FlattenedValue out;
  if (!flatten_into(value, out))
    return std::nullopt;
  return out;
}

} // namespace cvm
