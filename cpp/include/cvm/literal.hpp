// include/cvm/literal.hpp
#pragma once
#include "field.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cvm {

// Visibility of a value inside the proof system.
enum class Mode : std::uint8_t { Constant, Public, Private };

const char *mode_name(Mode m) noexcept;

// Least-constant join: any private input taints the result private.
inline constexpr Mode join(Mode a, Mode b) noexcept { return a < b ? b : a; }

enum class LiteralType : std::uint8_t {
  Address,
  Boolean,
  Field,
  Group,
  I8,
  I16,
  I32,
  I64,
  I128,
  U8,
  U16,
  U32,
  U64,
  U128,
  Scalar,
  String,
};

inline constexpr std::size_t kLiteralTypeCount = 16;

// Type suffix as written in literals ("field", "i8", ...).
const char *type_name(LiteralType t) noexcept;
// Bit width of an integer type, 0 for every other kind.
unsigned integer_width(LiteralType t) noexcept;

// A typed scalar carrying its own Mode.
//
// Storage depends on the kind: field, group (x-coordinate) and scalar use
// `field_`; integers and booleans keep their two's-complement bit pattern in
// `bits_`; address and string keep their text.
class Literal {
public:
  // Parses the complete text of one literal, e.g. "-3i8.private".
  // Throws cvm::ParseError.
  static Literal parse(std::string_view in);

  static Literal field(Field v, Mode m = Mode::Constant);
  static Literal group(Field x, Mode m = Mode::Constant);
  static Literal scalar(Field v, Mode m = Mode::Constant);
  static Literal boolean(bool v, Mode m = Mode::Constant);
  // `bits` is masked to the width of `t`. Throws std::invalid_argument if
  // `t` is not an integer type.
  static Literal integer(LiteralType t, __uint128_t bits,
                         Mode m = Mode::Constant);
  static Literal string(std::string v, Mode m = Mode::Constant);
  // Throws std::invalid_argument if `v` is not a well-formed address.
  static Literal address(std::string v, Mode m = Mode::Constant);

  LiteralType type() const noexcept { return type_; }
  Mode mode() const noexcept { return mode_; }

  const Field &field_value() const noexcept { return field_; }
  __uint128_t integer_bits() const noexcept { return bits_; }
  const std::string &text() const noexcept { return text_; }

  std::string to_string() const;

  bool operator==(const Literal &rhs) const noexcept;
  bool operator!=(const Literal &rhs) const noexcept { return !(*this == rhs); }

private:
  Literal(LiteralType t, Mode m) noexcept : type_(t), mode_(m) {}

  LiteralType type_;
  Mode mode_;
  Field field_;
  __uint128_t bits_ = 0;
  std::string text_;
};

} // namespace cvm
