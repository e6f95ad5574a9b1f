// include/cvm/field.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <gmp.h>
#include <string>
#include <vector>

namespace cvm {

// Element of the BLS12-377 scalar field, the native field of the circuits.
// Always kept reduced into [0, p).
class Field {
public:
  // Bit size of the modulus p.
  static constexpr std::size_t kModulusBits = 253;
  // Bits that always fit below p; used when packing raw data.
  static constexpr std::size_t kDataBits = kModulusBits - 1;

  Field() noexcept;
  explicit Field(std::uint64_t v);
  Field(const Field &other);
  Field(Field &&other) noexcept;
  Field &operator=(const Field &other);
  Field &operator=(Field &&other) noexcept;
  ~Field();

  static Field zero() { return Field(); }
  static Field one() { return Field(1); }

  // Reduces any integer modulo p.
  static Field from_mpz(mpz_srcptr v);
  // Canonical decimal only: throws std::invalid_argument unless 0 <= v < p.
  static Field from_decimal(const std::string &digits);
  // Little-endian bits; anything past the modulus is reduced.
  static Field from_bits_le(const std::vector<bool> &bits);
  static Field from_bytes_le_mod_order(const std::vector<std::uint8_t> &bytes);

  static mpz_srcptr modulus() noexcept;

  Field operator+(const Field &rhs) const;
  Field operator*(const Field &rhs) const;
  Field operator-() const;
  Field &operator+=(const Field &rhs);
  Field &operator*=(const Field &rhs);

  Field pow(std::uint64_t exponent) const;
  // Throws std::domain_error for zero.
  Field inverse() const;

  bool is_zero() const noexcept;
  bool operator==(const Field &rhs) const noexcept;
  bool operator!=(const Field &rhs) const noexcept { return !(*this == rhs); }

  mpz_srcptr get_mpz() const noexcept { return v_; }
  std::string to_string() const; // decimal, no suffix

private:
  void reduce();

  mpz_t v_;
};

} // namespace cvm
