// include/cvm/fields.hpp
#pragma once
#include "field.hpp"
#include "literal.hpp"
#include "value.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace cvm {

// How a literal kind maps onto field elements. Shared by every hash
// instruction so the variants cannot drift apart.
enum class FieldEncoding : std::uint8_t {
  Native,      // field: the element itself
  Integer,     // two's-complement bit pattern read as one unsigned element
  Scalar,      // scalar value re-encoded as one element
  PackedBytes, // little-endian bits in Field::kDataBits chunks
  Unsupported, // no encoding; hashing halts
};

FieldEncoding field_encoding(LiteralType t) noexcept;

struct FlattenedValue {
  std::vector<Field> fields;
  Mode mode = Mode::Constant;
};

// Returns std::nullopt when the literal kind has no field encoding.
std::optional<std::vector<Field>> to_fields(const Literal &literal);

// Flattens leaves in declared order and joins their modes. Returns
// std::nullopt if any leaf is unsupported.
std::optional<FlattenedValue> to_fields(const Value &value);

} // namespace cvm
