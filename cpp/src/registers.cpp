// src/registers.cpp
#include "cvm/registers.hpp"
#include "cvm/errors.hpp"

#include <utility>

namespace cvm {

Parsed<Register> Register::parse(std::string_view in) {
  std::string_view rest = text::expect(in, "r");
  if (rest.size() > 1 && rest[0] == '0' && rest[1] >= '0' && rest[1] <= '9')
    throw ParseError("leading zero in register " + text::near(in));
  Parsed<std::uint64_t> n = text::parse_u64(rest);
  if (text::word(n.rest).size() != 0)
    throw ParseError("malformed register " + text::near(in));
  return {Register(n.value), n.rest};
}

Register Register::from_string(std::string_view in) {
  Parsed<Register> p = parse(in);
  if (!p.rest.empty())
    throw ParseError("trailing input after register " + text::near(p.rest));
  return p.value;
}

void Registers::assign(const Register &r, Value v) {
  if (is_defined(r))
    halt("Register '" + r.to_string() + "' is already defined");
  values_.emplace(r.locator(), std::move(v));
}

const Value &Registers::load(const Register &r) const {
  auto it = values_.find(r.locator());
  if (it == values_.end())
    halt("Register '" + r.to_string() + "' is not defined");
  return it->second;
}

} // namespace cvm
