// include/cvm/parse.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace cvm {

// A parsed value plus the input that was not consumed.
template <typename T> struct Parsed {
  T value;
  std::string_view rest;
};

namespace text {

bool is_space(char c) noexcept;
std::string_view skip_space(std::string_view in) noexcept;
// Skips whitespace and `//` comments.
std::string_view skip_space_and_comments(std::string_view in) noexcept;

// Requires `token` at the front of `in`; throws cvm::ParseError otherwise.
std::string_view expect(std::string_view in, std::string_view token);
// Like expect(), but `token` must also end at a word boundary.
std::string_view expect_keyword(std::string_view in, std::string_view token);
// Requires at least one whitespace character.
std::string_view expect_space(std::string_view in);

// Leading run of [A-Za-z0-9_.] characters.
std::string_view word(std::string_view in) noexcept;

// Decimal u64 with no sign; throws cvm::ParseError on overflow or no digits.
Parsed<std::uint64_t> parse_u64(std::string_view in);

// Short excerpt of `in` for diagnostics.
std::string near(std::string_view in);

} // namespace text
} // namespace cvm
