// src/field.cpp
#include "cvm/field.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cvm {
namespace {

// p = 0x12ab655e9a2ca55660b44d1e5c37b00159aa76fed00000010a11800000000001
constexpr const char *kModulusDecimal =
    "8444461749428370424248824938781546531375899335154063827935233455917409239"
    "041";

struct Modulus {
  mpz_t p;
  Modulus() { mpz_init_set_str(p, kModulusDecimal, 10); }
  ~Modulus() { mpz_clear(p); }
  Modulus(const Modulus &) = delete;
  Modulus &operator=(const Modulus &) = delete;
};

const Modulus &field_modulus() {
  static const Modulus m;
  return m;
}

} // namespace

Field::Field() noexcept { mpz_init(v_); }

Field::Field(std::uint64_t v) {
  // mpz_set_ui takes unsigned long, which may be 32-bit.
  mpz_init(v_);
  mpz_import(v_, 1, -1, sizeof(v), 0, 0, &v);
  reduce();
}

Field::Field(const Field &other) { mpz_init_set(v_, other.v_); }

Field::Field(Field &&other) noexcept {
  mpz_init(v_);
  mpz_swap(v_, other.v_);
}

Field &Field::operator=(const Field &other) {
  if (this != &other)
    mpz_set(v_, other.v_);
  return *this;
}

Field &Field::operator=(Field &&other) noexcept {
  mpz_swap(v_, other.v_);
  return *this;
}

Field::~Field() { mpz_clear(v_); }

mpz_srcptr Field::modulus() noexcept { return field_modulus().p; }

void Field::reduce() {
  mpz_mod(v_, v_, modulus()); // result is non-negative
#if defined(CVM_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
  if (mpz_sgn(v_) < 0 || mpz_cmp(v_, modulus()) >= 0)
    throw std::logic_error("field invariant violated: element out of range");
#endif
}

Field Field::from_mpz(mpz_srcptr v) {
  Field f;
  mpz_set(f.v_, v);
  f.reduce();
  return f;
}

Field Field::from_decimal(const std::string &digits) {
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("invalid field digits '" + digits + "'");
  Field f;
  mpz_set_str(f.v_, digits.c_str(), 10);
  if (mpz_cmp(f.v_, modulus()) >= 0)
    throw std::invalid_argument("field element '" + digits +
                                "' is not below the modulus");
  return f;
}

Field Field::from_bits_le(const std::vector<bool> &bits) {
  Field f;
  for (std::size_t i = 0; i < bits.size(); ++i)
    if (bits[i])
      mpz_setbit(f.v_, i);
  f.reduce();
  return f;
}

Field Field::from_bytes_le_mod_order(const std::vector<std::uint8_t> &bytes) {
  Field f;
  if (!bytes.empty())
    mpz_import(f.v_, bytes.size(), -1, 1, 0, 0, bytes.data());
  f.reduce();
  return f;
}

Field Field::operator+(const Field &rhs) const {
  Field out(*this);
  out += rhs;
  return out;
}

Field Field::operator*(const Field &rhs) const {
  Field out(*this);
  out *= rhs;
  return out;
}

Field Field::operator-() const {
  Field out;
  if (mpz_sgn(v_) != 0)
    mpz_sub(out.v_, modulus(), v_);
  return out;
}

Field &Field::operator+=(const Field &rhs) {
  mpz_add(v_, v_, rhs.v_);
  if (mpz_cmp(v_, modulus()) >= 0)
    mpz_sub(v_, v_, modulus());
  return *this;
}

Field &Field::operator*=(const Field &rhs) {
  mpz_mul(v_, v_, rhs.v_);
  mpz_mod(v_, v_, modulus());
  return *this;
}

Field Field::pow(std::uint64_t exponent) const {
  mpz_t e;
  mpz_init(e);
  mpz_import(e, 1, -1, sizeof(exponent), 0, 0, &exponent);
  Field out;
  mpz_powm(out.v_, v_, e, modulus());
  mpz_clear(e);
  return out;
}

Field Field::inverse() const {
  Field out;
  if (mpz_invert(out.v_, v_, modulus()) == 0)
    throw std::domain_error("zero has no inverse in the field");
  return out;
}

bool Field::is_zero() const noexcept { return mpz_sgn(v_) == 0; }

bool Field::operator==(const Field &rhs) const noexcept {
  return mpz_cmp(v_, rhs.v_) == 0;
}

std::string Field::to_string() const {
  std::string out(mpz_sizeinbase(v_, 10) + 2, '\0');
  mpz_get_str(&out[0], 10, v_);
  out.resize(std::char_traits<char>::length(out.c_str()));
  return out;
}

} // namespace cvm
