// src/value.cpp
#include "cvm/value.hpp"
#include "cvm/errors.hpp"
#include "cvm/parse.hpp"

#include <cctype>

namespace cvm {
namespace {

bool ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}
bool ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Extent of a literal token: a quoted string with its mode suffix, or a run
// up to the next separator.
std::size_t literal_extent(std::string_view in) {
  std::size_t i = 0;
  if (!in.empty() && in[0] == '"') {
    for (i = 1; i < in.size(); ++i) {
      if (in[i] == '\\')
        ++i;
      else if (in[i] == '"') {
        ++i;
        break;
      }
    }
  }
  while (i < in.size() && !text::is_space(in[i]) && in[i] != ',' &&
         in[i] != '}')
    ++i;
  return i;
}

Parsed<Value> parse_value(std::string_view in, int depth);

constexpr int kMaxDepth = 32;

Parsed<Value> parse_composite(std::string_view in, int depth) {
  std::size_t n = 0;
  while (n < in.size() && ident_char(in[n]))
    ++n;
  Identifier name = Identifier::parse(in.substr(0, n));
  std::string_view rest = text::expect(text::skip_space(in.substr(n)), "{");

  std::vector<Value> members;
  rest = text::skip_space(rest);
  if (!rest.empty() && rest[0] == '}')
    return {Value(std::move(name), std::move(members)), rest.substr(1)};

  for (;;) {
    Parsed<Value> member = parse_value(rest, depth + 1);
    members.push_back(std::move(member.value));
    rest = text::skip_space(member.rest);
    if (!rest.empty() && rest[0] == ',') {
      rest = text::skip_space(rest.substr(1));
      if (!rest.empty() && rest[0] == '}') // trailing comma
        return {Value(std::move(name), std::move(members)), rest.substr(1)};
      continue;
    }
    rest = text::expect(rest, "}");
    return {Value(std::move(name), std::move(members)), rest};
  }
}

Parsed<Value> parse_value(std::string_view in, int depth) {
  if (depth > kMaxDepth)
    throw ParseError("composite nesting too deep");
  in = text::skip_space(in);
  if (in.empty())
    throw ParseError("expected a value " + text::near(in));

  // A bare identifier followed by '{' opens a composite. Literal keywords and
  // addresses never are.
  if (ident_start(in[0])) {
    std::size_t n = 0;
    while (n < in.size() && ident_char(in[n]))
      ++n;
    std::string_view after = text::skip_space(in.substr(n));
    if (!after.empty() && after[0] == '{')
      return parse_composite(in, depth);
  }

  const std::size_t n = literal_extent(in);
  return {Value(Literal::parse(in.substr(0, n))), in.substr(n)};
}

} // namespace

Identifier Identifier::parse(std::string_view in) {
  if (in.empty() || !ident_start(in[0]))
    throw ParseError("invalid identifier " + text::near(in));
  for (char c : in)
    if (!ident_char(c))
      throw ParseError("invalid identifier " + text::near(in));
  return Identifier(std::string(in));
}

Value Value::parse(std::string_view in) {
  Parsed<Value> p = parse_value(in, 0);
  if (!text::skip_space(p.rest).empty())
    throw ParseError("trailing input after value " + text::near(p.rest));
  return std::move(p.value);
}

std::string Value::to_string() const {
  if (is_literal())
    return literal().to_string();
  const Composite &c = composite();
  std::string out = c.name.str() + " {";
  for (std::size_t i = 0; i < c.members.size(); ++i) {
    out += i == 0 ? " " : ", ";
    out += c.members[i].to_string();
  }
  out += c.members.empty() ? "}" : " }";
  return out;
}

bool Value::operator==(const Value &rhs) const {
  if (is_literal() != rhs.is_literal())
    return false;
  if (is_literal())
    return literal() == rhs.literal();
  const Composite &a = composite();
  const Composite &b = rhs.composite();
  return a.name == b.name && a.members == b.members;
}

} // namespace cvm
