// include/cvm/registers.hpp
#pragma once
#include "bytes.hpp"
#include "parse.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace cvm {

// Register reference `r<locator>`.
class Register {
public:
  explicit Register(std::uint64_t locator = 0) noexcept : locator_(locator) {}

  static Parsed<Register> parse(std::string_view in);
  // Whole-string form of parse(); throws cvm::ParseError on trailing input.
  static Register from_string(std::string_view in);

  static Register read(ByteReader &in) { return Register(in.read_u64()); }
  void write(ByteWriter &out) const { out.write_u64(locator_); }

  std::uint64_t locator() const noexcept { return locator_; }
  std::string to_string() const { return "r" + std::to_string(locator_); }

  bool operator==(const Register &rhs) const noexcept {
    return locator_ == rhs.locator_;
  }
  bool operator!=(const Register &rhs) const noexcept {
    return !(*this == rhs);
  }

private:
  std::uint64_t locator_;
};

// Single-assignment register file. A register is either undefined or holds
// exactly one Value for the rest of the program.
class Registers {
public:
  bool is_defined(const Register &r) const {
    return values_.count(r.locator()) != 0;
  }

  // Halts if `r` already holds a value.
  void assign(const Register &r, Value v);
  // Halts if `r` was never assigned.
  const Value &load(const Register &r) const;

  std::size_t size() const noexcept { return values_.size(); }
  // Ordered by locator.
  const std::map<std::uint64_t, Value> &entries() const noexcept {
    return values_;
  }

private:
  std::map<std::uint64_t, Value> values_;
};

} // namespace cvm
