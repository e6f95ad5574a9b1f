// src/parse.cpp
#include "cvm/parse.hpp"
#include "cvm/errors.hpp"

#include <cctype>
#include <limits>

namespace cvm {
namespace text {

bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string_view skip_space(std::string_view in) noexcept {
  std::size_t i = 0;
  while (i < in.size() && is_space(in[i]))
    ++i;
  return in.substr(i);
}

std::string_view skip_space_and_comments(std::string_view in) noexcept {
  for (;;) {
    in = skip_space(in);
    if (in.substr(0, 2) != "//")
      return in;
    const std::size_t eol = in.find('\n');
    in = eol == std::string_view::npos ? std::string_view{} : in.substr(eol);
  }
}

std::string_view expect(std::string_view in, std::string_view token) {
  if (in.substr(0, token.size()) != token)
    throw ParseError("expected '" + std::string(token) + "' " + near(in));
  return in.substr(token.size());
}

std::string_view expect_keyword(std::string_view in, std::string_view token) {
  std::string_view rest = expect(in, token);
  if (!rest.empty() && (std::isalnum(static_cast<unsigned char>(rest[0])) ||
                        rest[0] == '_' || rest[0] == '.'))
    throw ParseError("expected '" + std::string(token) + "' " + near(in));
  return rest;
}

std::string_view expect_space(std::string_view in) {
  if (in.empty() || !is_space(in[0]))
    throw ParseError("expected whitespace " + near(in));
  return skip_space(in);
}

std::string_view word(std::string_view in) noexcept {
  std::size_t i = 0;
  while (i < in.size() && (std::isalnum(static_cast<unsigned char>(in[i])) ||
                           in[i] == '_' || in[i] == '.'))
    ++i;
  return in.substr(0, i);
}

Parsed<std::uint64_t> parse_u64(std::string_view in) {
  std::size_t i = 0;
  std::uint64_t v = 0;
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  while (i < in.size() && in[i] >= '0' && in[i] <= '9') {
    const std::uint64_t d = static_cast<std::uint64_t>(in[i] - '0');
    if (v > (kMax - d) / 10)
      throw ParseError("number out of range " + near(in));
    v = v * 10 + d;
    ++i;
  }
  if (i == 0)
    throw ParseError("expected a number " + near(in));
  return {v, in.substr(i)};
}

std::string near(std::string_view in) {
  if (in.empty())
    return "at end of input";
  constexpr std::size_t kExcerpt = 24;
  std::string out = "near '";
  out += std::string(in.substr(0, kExcerpt));
  if (in.size() > kExcerpt)
    out += "...";
  out += "'";
  return out;
}

} // namespace text
} // namespace cvm
