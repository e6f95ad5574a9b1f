// include/cvm/value.hpp
#pragma once
#include "literal.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cvm {

// Name of a composite: [A-Za-z][A-Za-z0-9_]*.
class Identifier {
public:
  // Throws cvm::ParseError.
  static Identifier parse(std::string_view in);

  const std::string &str() const noexcept { return name_; }

  bool operator==(const Identifier &rhs) const noexcept {
    return name_ == rhs.name_;
  }
  bool operator!=(const Identifier &rhs) const noexcept {
    return !(*this == rhs);
  }

private:
  explicit Identifier(std::string name) : name_(std::move(name)) {}

  std::string name_;
};

class Value;

// Named record; members keep their own modes.
struct Composite {
  Identifier name;
  std::vector<Value> members;
};

// What a register holds: a literal, or a composite of values.
class Value {
public:
  Value(Literal literal) : data_(std::move(literal)) {}
  Value(Identifier name, std::vector<Value> members)
      : data_(Composite{std::move(name), std::move(members)}) {}

  // Literal text, or `name { v, v, ... }` with nesting.
  // Throws cvm::ParseError.
  static Value parse(std::string_view in);

  bool is_literal() const noexcept {
    return std::holds_alternative<Literal>(data_);
  }
  // Precondition: is_literal().
  const Literal &literal() const { return std::get<Literal>(data_); }
  // Precondition: !is_literal().
  const Composite &composite() const { return std::get<Composite>(data_); }

  std::string to_string() const;

  bool operator==(const Value &rhs) const;
  bool operator!=(const Value &rhs) const { return !(*this == rhs); }

private:
  std::variant<Literal, Composite> data_;
};

} // namespace cvm
