// src/literal.cpp
#include "cvm/literal.hpp"
#include "cvm/errors.hpp"
#include "cvm/parse.hpp"

#include <cstdint>
#include <cstring>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace cvm {
namespace {

// Scalar field of the BLS12-377 embedded Edwards curve.
constexpr const char *kScalarModulusDecimal =
    "2111115437357092606062206234695386632838870926408408195193685246394721360"
    "383";

constexpr const char *kAddressPrefix = "aleo1";
constexpr std::size_t kAddressLength = 63;
constexpr const char *kBech32Charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

struct TypeInfo {
  LiteralType type;
  const char *name;
  unsigned width; // integers only
  bool is_signed;
};

// Indexed by LiteralType.
constexpr TypeInfo kTypes[] = {
    {LiteralType::Address, "address", 0, false},
    {LiteralType::Boolean, "boolean", 0, false},
    {LiteralType::Field, "field", 0, false},
    {LiteralType::Group, "group", 0, false},
    {LiteralType::I8, "i8", 8, true},
    {LiteralType::I16, "i16", 16, true},
    {LiteralType::I32, "i32", 32, true},
    {LiteralType::I64, "i64", 64, true},
    {LiteralType::I128, "i128", 128, true},
    {LiteralType::U8, "u8", 8, false},
    {LiteralType::U16, "u16", 16, false},
    {LiteralType::U32, "u32", 32, false},
    {LiteralType::U64, "u64", 64, false},
    {LiteralType::U128, "u128", 128, false},
    {LiteralType::Scalar, "scalar", 0, false},
    {LiteralType::String, "string", 0, false},
};
static_assert(sizeof(kTypes) / sizeof(kTypes[0]) == kLiteralTypeCount,
              "type table out of sync with LiteralType");

const TypeInfo &info(LiteralType t) noexcept {
  return kTypes[static_cast<std::size_t>(t)];
}

__uint128_t width_mask(unsigned width) noexcept {
  return width >= 128 ? ~(__uint128_t)0 : (((__uint128_t)1 << width) - 1);
}

// RAII holder for a scratch mpz_t.
struct Mpz {
  mpz_t v;
  Mpz() { mpz_init(v); }
  ~Mpz() { mpz_clear(v); }
  Mpz(const Mpz &) = delete;
  Mpz &operator=(const Mpz &) = delete;
};

void set_u128(mpz_t out, __uint128_t x) {
  const std::uint64_t words[2] = {static_cast<std::uint64_t>(x),
                                  static_cast<std::uint64_t>(x >> 64)};
  mpz_import(out, 2, -1, sizeof(std::uint64_t), 0, 0, words);
}

__uint128_t get_u128(const mpz_t in) {
  std::uint64_t words[2] = {0, 0};
  std::size_t count = 0;
  mpz_export(words, &count, -1, sizeof(std::uint64_t), 0, 0, in);
  return (__uint128_t)words[1] << 64 | words[0];
}

std::string mpz_to_decimal(const mpz_t v) {
  std::string out(mpz_sizeinbase(v, 10) + 2, '\0');
  mpz_get_str(&out[0], 10, v);
  out.resize(std::strlen(out.c_str()));
  return out;
}

bool is_digits(const std::string &s) {
  return !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
}

bool valid_address(const std::string &s) {
  if (s.size() != kAddressLength || s.compare(0, 5, kAddressPrefix) != 0)
    return false;
  for (std::size_t i = 5; i < s.size(); ++i)
    if (std::strchr(kBech32Charset, s[i]) == nullptr)
      return false;
  return true;
}

Mode parse_mode(std::string_view suffix, std::string_view whole) {
  if (suffix.empty() || suffix == ".constant")
    return Mode::Constant;
  if (suffix == ".public")
    return Mode::Public;
  if (suffix == ".private")
    return Mode::Private;
  throw ParseError("invalid mode in literal " + text::near(whole));
}

// Closing quote index of a string literal starting at in[0] == '"'.
std::size_t closing_quote(std::string_view in) {
  for (std::size_t i = 1; i < in.size(); ++i) {
    if (in[i] == '\\')
      ++i;
    else if (in[i] == '"')
      return i;
  }
  throw ParseError("unterminated string literal " + text::near(in));
}

std::string unescape(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c == '\\') {
      if (++i == body.size())
        throw ParseError("dangling escape in string literal");
      switch (body[i]) {
      case '"':
      case '\\':
        c = body[i];
        break;
      case 'n':
        c = '\n';
        break;
      case 't':
        c = '\t';
        break;
      default:
        throw ParseError(std::string("unknown escape '\\") + body[i] +
                         "' in string literal");
      }
    }
    out.push_back(c);
  }
  return out;
}

std::string escape(const std::string &s) {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

LiteralType type_from_suffix(const std::string &suffix, std::string_view whole) {
  for (const TypeInfo &t : kTypes) {
    if (t.type == LiteralType::Address || t.type == LiteralType::Boolean ||
        t.type == LiteralType::String)
      continue;
    if (suffix == t.name)
      return t.type;
  }
  throw ParseError("unknown literal type '" + suffix + "' in " +
                   text::near(whole));
}

// Parses "<sign?><digits>" into `out`.
void parse_signed_decimal(mpz_t out, const std::string &digits, bool negative,
                          std::string_view whole) {
  if (!is_digits(digits))
    throw ParseError("expected digits in literal " + text::near(whole));
  mpz_set_str(out, digits.c_str(), 10);
  if (negative)
    mpz_neg(out, out);
}

Literal parse_number(std::string_view body, Mode mode, std::string_view whole) {
  const bool negative = !body.empty() && body.front() == '-';
  std::string_view rest = negative ? body.substr(1) : body;
  const std::size_t split = rest.find_first_not_of("0123456789");
  if (split == 0 || split == std::string_view::npos)
    throw ParseError("malformed literal " + text::near(whole));
  const std::string digits(rest.substr(0, split));
  const LiteralType type = type_from_suffix(std::string(rest.substr(split)),
                                            whole);

  Mpz v;
  parse_signed_decimal(v.v, digits, negative, whole);

  if (type == LiteralType::Field || type == LiteralType::Group) {
    if (mpz_cmpabs(v.v, Field::modulus()) >= 0)
      throw ParseError("value out of range for field in " +
                       text::near(whole));
    Field f = Field::from_mpz(v.v); // reduces negatives mod p
    return type == LiteralType::Field ? Literal::field(std::move(f), mode)
                                      : Literal::group(std::move(f), mode);
  }

  if (type == LiteralType::Scalar) {
    Mpz modulus;
    mpz_set_str(modulus.v, kScalarModulusDecimal, 10);
    if (mpz_sgn(v.v) < 0 || mpz_cmp(v.v, modulus.v) >= 0)
      throw ParseError("value out of range for scalar in " +
                       text::near(whole));
    return Literal::scalar(Field::from_mpz(v.v), mode);
  }

  // Integers: range check against the declared width.
  const TypeInfo &t = info(type);
  Mpz lo, hi;
  if (t.is_signed) {
    mpz_set_ui(hi.v, 1);
    mpz_mul_2exp(hi.v, hi.v, t.width - 1); // 2^(w-1)
    mpz_neg(lo.v, hi.v);
    mpz_sub_ui(hi.v, hi.v, 1);
  } else {
    mpz_set_ui(lo.v, 0);
    mpz_set_ui(hi.v, 1);
    mpz_mul_2exp(hi.v, hi.v, t.width);
    mpz_sub_ui(hi.v, hi.v, 1);
  }
  if (mpz_cmp(v.v, lo.v) < 0 || mpz_cmp(v.v, hi.v) > 0)
    throw ParseError("value out of range for " + std::string(t.name) + " in " +
                     text::near(whole));

  if (mpz_sgn(v.v) < 0) {
    // Two's complement: v + 2^w.
    Mpz base;
    mpz_set_ui(base.v, 1);
    mpz_mul_2exp(base.v, base.v, t.width);
    mpz_add(v.v, v.v, base.v);
  }
  return Literal::integer(type, get_u128(v.v), mode);
}

} // namespace

const char *mode_name(Mode m) noexcept {
  switch (m) {
  case Mode::Constant:
    return "constant";
  case Mode::Public:
    return "public";
  case Mode::Private:
    return "private";
  }
  return "constant";
}

const char *type_name(LiteralType t) noexcept { return info(t).name; }

unsigned integer_width(LiteralType t) noexcept { return info(t).width; }

Literal Literal::field(Field v, Mode m) {
  Literal l(LiteralType::Field, m);
  l.field_ = std::move(v);
  return l;
}

Literal Literal::group(Field x, Mode m) {
  Literal l(LiteralType::Group, m);
  l.field_ = std::move(x);
  return l;
}

Literal Literal::scalar(Field v, Mode m) {
  Literal l(LiteralType::Scalar, m);
  l.field_ = std::move(v);
  return l;
}

Literal Literal::boolean(bool v, Mode m) {
  Literal l(LiteralType::Boolean, m);
  l.bits_ = v ? 1 : 0;
  return l;
}

Literal Literal::integer(LiteralType t, __uint128_t bits, Mode m) {
  const unsigned width = integer_width(t);
  if (width == 0)
    throw std::invalid_argument(std::string("'") + type_name(t) +
                                "' is not an integer type");
  Literal l(t, m);
  l.bits_ = bits & width_mask(width);
  return l;
}

Literal Literal::string(std::string v, Mode m) {
  Literal l(LiteralType::String, m);
  l.text_ = std::move(v);
  return l;
}

Literal Literal::address(std::string v, Mode m) {
  if (!valid_address(v))
    throw std::invalid_argument("malformed address '" + v + "'");
  Literal l(LiteralType::Address, m);
  l.text_ = std::move(v);
  return l;
}

Literal Literal::parse(std::string_view whole) {
  if (whole.empty())
    throw ParseError("empty literal");

  std::string_view body, suffix;
  if (whole.front() == '"') {
    const std::size_t close = closing_quote(whole);
    body = whole.substr(0, close + 1);
    suffix = whole.substr(close + 1);
  } else {
    const std::size_t dot = whole.find('.');
    body = whole.substr(0, dot);
    suffix = dot == std::string_view::npos ? std::string_view{}
                                           : whole.substr(dot);
  }
  if (body.empty())
    throw ParseError("missing value in literal " + text::near(whole));
  const Mode mode = parse_mode(suffix, whole);

  if (body == "true" || body == "false")
    return Literal::boolean(body == "true", mode);
  if (body.front() == '"')
    return Literal::string(unescape(body.substr(1, body.size() - 2)), mode);
  if (body.compare(0, 5, kAddressPrefix) == 0) {
    const std::string addr(body);
    if (!valid_address(addr))
      throw ParseError("malformed address " + text::near(whole));
    return Literal::address(addr, mode);
  }
  return parse_number(body, mode, whole);
}

std::string Literal::to_string() const {
  std::string out;
  switch (type_) {
  case LiteralType::Address:
    out = text_;
    break;
  case LiteralType::Boolean:
    out = bits_ ? "true" : "false";
    break;
  case LiteralType::Field:
  case LiteralType::Group:
  case LiteralType::Scalar:
    out = field_.to_string() + type_name(type_);
    break;
  case LiteralType::String:
    out = escape(text_);
    break;
  default: {
    const TypeInfo &t = info(type_);
    Mpz v;
    set_u128(v.v, bits_);
    if (t.is_signed && mpz_tstbit(v.v, t.width - 1)) {
      Mpz base;
      mpz_set_ui(base.v, 1);
      mpz_mul_2exp(base.v, base.v, t.width);
      mpz_sub(v.v, v.v, base.v);
    }
    out = mpz_to_decimal(v.v) + t.name;
  }
  }
  if (mode_ != Mode::Constant)
    out += std::string(".") + mode_name(mode_);
  return out;
}

bool Literal::operator==(const Literal &rhs) const noexcept {
  return type_ == rhs.type_ && mode_ == rhs.mode_ && field_ == rhs.field_ &&
         bits_ == rhs.bits_ && text_ == rhs.text_;
}

} // namespace cvm
