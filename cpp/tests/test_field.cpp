#include "cvm/field.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <utility>

namespace {
const char* kPMinusOne =
    "8444461749428370424248824938781546531375899335154063827935233455917409239040";
}

TEST_CASE("Modulus is the 253-bit BLS12-377 scalar field prime") {
  using cvm::Field;
  REQUIRE(mpz_sizeinbase(Field::modulus(), 2) == Field::kModulusBits);
  REQUIRE(mpz_probab_prime_p(Field::modulus(), 25) > 0);
}

TEST_CASE("Arithmetic wraps around the modulus") {
  using cvm::Field;
  Field top = Field::from_decimal(kPMinusOne);
  REQUIRE((top + Field::one()).is_zero());
  REQUIRE((-Field::one()) == top);
  REQUIRE((-Field::zero()).is_zero());
  REQUIRE((top * top) == Field::one());  // (-1)^2
  REQUIRE(Field(3).pow(4) == Field(81));
  REQUIRE(Field(7) * Field(7).inverse() == Field::one());
  REQUIRE_THROWS_AS(Field::zero().inverse(), std::domain_error);
}

TEST_CASE("Decimal parsing accepts only canonical elements") {
  using cvm::Field;
  REQUIRE(Field::from_decimal("0").is_zero());
  REQUIRE(Field::from_decimal(kPMinusOne).to_string() == kPMinusOne);
  REQUIRE_THROWS_AS(
      Field::from_decimal("8444461749428370424248824938781546531375899335154063827935233455917409239041"),
      std::invalid_argument);
  for (auto bad : {"", "-1", "12a", " 1"}) {
    REQUIRE_THROWS_AS(Field::from_decimal(bad), std::invalid_argument);
  }
}

TEST_CASE("Bit and byte constructors are little-endian") {
  using cvm::Field;
  REQUIRE(Field::from_bits_le({true, false, true}) == Field(5));
  REQUIRE(Field::from_bits_le({}).is_zero());
  REQUIRE(Field::from_bytes_le_mod_order({0x01, 0x02}) == Field(0x0201));
  REQUIRE(Field(UINT64_MAX).to_string() == "18446744073709551615");
}

TEST_CASE("Copies and moves keep values independent") {
  using cvm::Field;
  Field a(42);
  Field b = a;
  b += Field::one();
  REQUIRE(a == Field(42));
  REQUIRE(b == Field(43));
  Field c = std::move(b);
  REQUIRE(c == Field(43));
  a = c;
  REQUIRE(a == c);
}
