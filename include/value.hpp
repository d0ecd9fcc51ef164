#pragma once

#include "common.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// a single cell in a mixing bowl or baking dish. liquid values are served as
// characters, everything else as numbers
struct Value
{
  i64 number = 0;
  bool liquid = false;

  bool operator==(const Value &) const = default;
};

struct Ingredient
{
  enum class Kind
  {
    Dry,
    Liquid,
    Either,
  };

  std::string name;
  std::optional<i64> initialValue;
  Kind kind = Kind::Either;

  bool operator==(const Ingredient &) const = default;

  // the value an ingredient holds when a recipe starts
  Value initial() const noexcept
  {
    return Value{initialValue.value_or(0), kind == Kind::Liquid};
  }
};

// measures that can follow the quantity in an ingredient line
std::optional<Ingredient::Kind> measureKind(std::string_view measure) noexcept;

std::ostream &operator<<(std::ostream &os, const Value &v);
std::ostream &operator<<(std::ostream &os, const Ingredient::Kind &k);
std::ostream &operator<<(std::ostream &os, const Ingredient &i);
