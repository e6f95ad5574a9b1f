#include "cvm/fields.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <string>

TEST_CASE("Allow-list covers every literal kind") {
  using cvm::FieldEncoding; using cvm::LiteralType; using cvm::field_encoding;
  REQUIRE(field_encoding(LiteralType::Field) == FieldEncoding::Native);
  REQUIRE(field_encoding(LiteralType::Scalar) == FieldEncoding::Scalar);
  REQUIRE(field_encoding(LiteralType::String) == FieldEncoding::PackedBytes);
  for (auto t : {LiteralType::I8, LiteralType::I16, LiteralType::I32, LiteralType::I64,
                 LiteralType::I128, LiteralType::U8, LiteralType::U16, LiteralType::U32,
                 LiteralType::U64, LiteralType::U128}) {
    REQUIRE(field_encoding(t) == FieldEncoding::Integer);
  }
  for (auto t : {LiteralType::Boolean, LiteralType::Address, LiteralType::Group}) {
    REQUIRE(field_encoding(t) == FieldEncoding::Unsupported);
  }
}

TEST_CASE("Every numeric literal of value one flattens to the same element") {
  using cvm::Literal;
  for (auto text : {"1field", "1i8", "1i16", "1i32", "1i64", "1i128", "1u8", "1u16",
                    "1u32", "1u64", "1u128", "1scalar"}) {
    auto fields = cvm::to_fields(Literal::parse(text));
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 1);
    REQUIRE(fields->front() == cvm::Field::one());
  }
}

TEST_CASE("Negative integers flatten to their bit pattern") {
  auto fields = cvm::to_fields(cvm::Literal::parse("-1i8"));
  REQUIRE(fields.has_value());
  REQUIRE(fields->front() == cvm::Field(255));
  fields = cvm::to_fields(cvm::Literal::parse("-1i64"));
  REQUIRE(fields->front() == cvm::Field(UINT64_MAX));
}

TEST_CASE("Strings pack little-endian bytes into 252-bit chunks") {
  auto short_str = cvm::to_fields(cvm::Literal::parse("\"aaaaaaaa\""));
  REQUIRE(short_str.has_value());
  REQUIRE(short_str->size() == 1);
  REQUIRE(short_str->front() == cvm::Field(0x6161616161616161ull));

  // 40 bytes = 320 bits -> 252 + 68.
  auto long_str = cvm::to_fields(cvm::Literal::string(std::string(40, 'a')));
  REQUIRE(long_str->size() == 2);

  auto empty = cvm::to_fields(cvm::Literal::string(""));
  REQUIRE(empty.has_value());
  REQUIRE(empty->empty());
}

TEST_CASE("Unsupported kinds do not flatten") {
  for (auto text : {"true", "2group",
                    "aleo1d5hg2z3ma00382pngntdp68e74zv54jdxy249qhaujhks9c72yrs33ddah"}) {
    REQUIRE_FALSE(cvm::to_fields(cvm::Literal::parse(text)).has_value());
    REQUIRE_FALSE(cvm::to_fields(cvm::Value::parse(text)).has_value());
  }
  // One bad leaf rejects the whole composite.
  REQUIRE_FALSE(cvm::to_fields(cvm::Value::parse("m { 1field, inner { true } }")).has_value());
}

TEST_CASE("Composites concatenate in declared order and join modes") {
  using cvm::Mode; using cvm::Value;
  auto flat = cvm::to_fields(Value::parse("m { 1field.public, 2field.private }"));
  REQUIRE(flat.has_value());
  REQUIRE(flat->fields.size() == 2);
  REQUIRE(flat->fields[0] == cvm::Field(1));
  REQUIRE(flat->fields[1] == cvm::Field(2));
  REQUIRE(flat->mode == Mode::Private);

  REQUIRE(cvm::to_fields(Value::parse("m { 1field, 2u8.public }"))->mode == Mode::Public);
  REQUIRE(cvm::to_fields(Value::parse("m { 1field, 2u8 }"))->mode == Mode::Constant);
  REQUIRE(cvm::to_fields(Value::parse("m { a { 1field }, b { 2u8.private } }"))->mode ==
          Mode::Private);
  REQUIRE(cvm::to_fields(Value::parse("m { \"ab\", 3u8 }"))->fields.size() == 2);
}

TEST_CASE("Mode join is the least-constant bound") {
  using cvm::Mode; using cvm::join;
  REQUIRE(join(Mode::Constant, Mode::Constant) == Mode::Constant);
  REQUIRE(join(Mode::Constant, Mode::Public) == Mode::Public);
  REQUIRE(join(Mode::Public, Mode::Private) == Mode::Private);
  REQUIRE(join(Mode::Private, Mode::Constant) == Mode::Private);
}
