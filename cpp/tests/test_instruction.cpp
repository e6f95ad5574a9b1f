#include "cvm/errors.hpp"
#include "cvm/instruction.hpp"
#include <catch2/catch.hpp>
#include <set>
#include <variant>
#include <cstdint>
#include <string>
#include <vector>

namespace {

const char* kDigestOne =
    "3999071741215241790607111275574824668617854796802626587041088136954841194555field";

// Hashes `input` in r0 into r1 and returns r1.
template <typename Op>
cvm::Value hash_value(const cvm::Value& input) {
  cvm::Registers regs;
  regs.assign(cvm::Register(0), input);
  Op::from_operands("r0 into r1").evaluate(regs);
  return regs.load(cvm::Register(1));
}

// The digest keeps the operand's mode for each of the three modes.
template <typename Op>
void check_modes(const std::string& literal, const std::string& digest) {
  for (std::string mode : {"", ".public", ".private"}) {
    auto out = hash_value<Op>(cvm::Value::parse(literal + mode));
    REQUIRE(out.to_string() == digest + mode);
  }
}

template <typename Op>
void check_halts(const std::string& literal) {
  cvm::Registers regs;
  regs.assign(cvm::Register(0), cvm::Value::parse(literal));
  auto op = Op::from_operands("r0 into r1");
  try {
    op.evaluate(regs);
    FAIL("expected a halt for " << literal);
  } catch (const cvm::Halt& e) {
    REQUIRE(std::string(e.what()) == "Invalid '" + std::string(Op::opcode()) + "' instruction");
  }
  REQUIRE_FALSE(regs.is_defined(cvm::Register(1)));
}

}  // namespace

TEST_CASE("Opcodes are unique and dispatch to their variant") {
  using cvm::Instruction;
  std::set<std::string> seen;
  for (auto text : {"hash.psd2 r0 into r1;", "hash.psd4 r0 into r1;", "hash.psd8 r0 into r1;"}) {
    auto p = Instruction::parse(text);
    REQUIRE(p.rest.empty());
    REQUIRE(p.value.to_string() == text);
    REQUIRE(seen.insert(std::string(p.value.opcode())).second);
  }
  auto p = Instruction::parse("hash.psd8 r0 into r1;");
  REQUIRE(std::holds_alternative<cvm::HashPsd8>(p.value.variant()));
  REQUIRE(p.value.tag() == 2);
  REQUIRE(cvm::HashPsd8::opcode() == "hash.psd8");
}

TEST_CASE("Parser tolerates whitespace and returns the remainder") {
  auto p = cvm::HashPsd8::parse("hash.psd8   r12\tinto\n r3 ;  hash.psd2 r0 into r1;");
  REQUIRE(p.value.operation().source() == cvm::Register(12));
  REQUIRE(p.value.operation().destination() == cvm::Register(3));
  REQUIRE(p.rest == "  hash.psd2 r0 into r1;");
}

TEST_CASE("Malformed instruction text is a parse error") {
  using cvm::Instruction; using cvm::ParseError;
  for (auto bad : {"", "hash.psd8", "hash.psd8 r0 into r1", "hash.psd8 r0 r1;",
                   "hash.psd8 r0 onto r1;", "hash.psd8 r0 intor1;", "hash.psd8r0 into r1;",
                   "hash.psd16 r0 into r1;", "hash.psd8 r0 into 1field;", "hash.psd8 r0 into r1:"}) {
    REQUIRE_THROWS_AS(Instruction::parse(bad), ParseError);
  }
}

TEST_CASE("Byte encoding round-trips and is little-endian") {
  using cvm::ByteReader; using cvm::ByteWriter; using cvm::Instruction;
  auto ins = Instruction::parse("hash.psd4 r1 into r258;").value;
  ByteWriter w;
  ins.write(w);
  const std::vector<std::uint8_t> expected = {
      0x01, 0x00,                                      // tag: hash.psd4
      0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  // r1
      0x02, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  // r258
  };
  REQUIRE(w.bytes() == expected);

  ByteReader r(expected);
  auto back = Instruction::read(r);
  REQUIRE(r.at_end());
  REQUIRE(back == ins);
  REQUIRE(back.opcode() == "hash.psd4");

  ByteWriter again;
  back.write(again);
  REQUIRE(again.bytes() == expected);
}

TEST_CASE("Truncated or unknown bytes are decode errors") {
  using cvm::ByteReader; using cvm::DecodeError; using cvm::Instruction;
  const std::vector<std::uint8_t> truncated = {0x02, 0x00, 0x01, 0x00};
  ByteReader r1(truncated);
  REQUIRE_THROWS_AS(Instruction::read(r1), DecodeError);

  std::vector<std::uint8_t> unknown(18, 0);
  unknown[0] = 0x09;
  ByteReader r2(unknown);
  REQUIRE_THROWS_AS(Instruction::read(r2), DecodeError);

  const std::vector<std::uint8_t> empty;
  ByteReader r3(empty);
  REQUIRE_THROWS_AS(cvm::HashPsd8::read(r3), DecodeError);
}

TEST_CASE("hash.psd8 digests of field and integer literals") {
  using cvm::HashPsd8;
  for (auto literal : {"1field", "1i8", "1i16", "1i32", "1i64", "1i128", "1u8", "1u16",
                       "1u32", "1u64", "1u128", "1scalar"}) {
    check_modes<HashPsd8>(literal, kDigestOne);
  }
}

TEST_CASE("hash.psd8 digest of a string literal") {
  check_modes<cvm::HashPsd8>(
      "\"aaaaaaaa\"",
      "4020837770720319542691472472080405581209506316726251354702740114046129734437field");
}

TEST_CASE("hash.psd8 digest of a multi-chunk string") {
  auto out = hash_value<cvm::HashPsd8>(cvm::Literal::string(std::string(40, 'a')));
  REQUIRE(out.to_string() ==
          "1256569519913515202958198259553707208335068257496578799075611089795725739925field");
}

TEST_CASE("hash.psd8 digest of a negative integer uses its bit pattern") {
  auto out = hash_value<cvm::HashPsd8>(cvm::Value::parse("-1i8"));
  REQUIRE(out == hash_value<cvm::HashPsd8>(cvm::Value::parse("255u8")));
  REQUIRE(out.to_string() ==
          "4339636349157983279679632825778177545516577958129653058774419061799280393289field");
}

TEST_CASE("Sibling widths hash with their own parameters") {
  check_modes<cvm::HashPsd2>(
      "1field", "895920223209807336032370141805192618496779881680412280727415085489332840844field");
  check_modes<cvm::HashPsd4>(
      "1u32", "1088580045362314438112823188316979551898376415861015087020772893540491855029field");
}

TEST_CASE("Boolean, address and group operands halt") {
  const char* address = "aleo1d5hg2z3ma00382pngntdp68e74zv54jdxy249qhaujhks9c72yrs33ddah";
  for (auto literal : {"true", "2group", address}) {
    check_halts<cvm::HashPsd2>(literal);
    check_halts<cvm::HashPsd4>(literal);
    check_halts<cvm::HashPsd8>(literal);
  }
  check_halts<cvm::HashPsd8>("m { 1field, false.private }");
}

TEST_CASE("Composite digest is private when any leaf is private") {
  using cvm::Identifier; using cvm::Literal; using cvm::Value;
  Value first(Identifier::parse("message"),
              {Literal::parse("1field.public"), Literal::parse("2field.private")});
  auto out = hash_value<cvm::HashPsd8>(first);
  REQUIRE(out == Value::parse(
                     "2132636093982099992808836832692348220698310395516022520468979890154979376079field.private"));

  // Same elements, no private leaf.
  auto pub = hash_value<cvm::HashPsd8>(Value::parse("message { 1field.public, 2field }"));
  REQUIRE(pub.literal().mode() == cvm::Mode::Public);
  REQUIRE(pub.literal().field_value() == out.literal().field_value());
  REQUIRE(hash_value<cvm::HashPsd8>(Value::parse("message { 1field, 2field }")).literal().mode() ==
          cvm::Mode::Constant);
}

TEST_CASE("Hashing is deterministic") {
  auto v = cvm::Value::parse("m { 7u64.private, \"seven\", n { 7scalar } }");
  REQUIRE(hash_value<cvm::HashPsd8>(v) == hash_value<cvm::HashPsd8>(v));
  REQUIRE(hash_value<cvm::HashPsd4>(v) != hash_value<cvm::HashPsd8>(v));
}

TEST_CASE("Undefined source register halts") {
  cvm::Registers regs;
  auto op = cvm::HashPsd8::from_operands("r0 into r1");
  REQUIRE_THROWS_AS(op.evaluate(regs), cvm::Halt);
  REQUIRE(regs.size() == 0);
}

TEST_CASE("Writing an already defined destination halts") {
  cvm::Registers regs;
  regs.assign(cvm::Register(0), cvm::Value::parse("1field"));
  regs.assign(cvm::Register(1), cvm::Value::parse("5field"));
  REQUIRE_THROWS_AS(cvm::HashPsd8::from_operands("r0 into r1").evaluate(regs), cvm::Halt);
  REQUIRE(regs.load(cvm::Register(1)) == cvm::Value::parse("5field"));
  // Hashing a register into itself is the same violation.
  REQUIRE_THROWS_AS(cvm::HashPsd8::from_operands("r0 into r0").evaluate(regs), cvm::Halt);
}
