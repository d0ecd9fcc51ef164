#include "value.hpp"

#include <string_view>
#include <utility>

std::optional<Ingredient::Kind> measureKind(std::string_view measure) noexcept
{
  static const std::pair<const char*, Ingredient::Kind> measures[] = {
    {"g", Ingredient::Kind::Dry},
    {"kg", Ingredient::Kind::Dry},
    {"pinch", Ingredient::Kind::Dry},
    {"pinches", Ingredient::Kind::Dry},
    {"ml", Ingredient::Kind::Liquid},
    {"l", Ingredient::Kind::Liquid},
    {"dash", Ingredient::Kind::Liquid},
    {"dashes", Ingredient::Kind::Liquid},
    {"cup", Ingredient::Kind::Either},
    {"cups", Ingredient::Kind::Either},
    {"teaspoon", Ingredient::Kind::Either},
    {"teaspoons", Ingredient::Kind::Either},
    {"tablespoon", Ingredient::Kind::Either},
    {"tablespoons", Ingredient::Kind::Either},
  };

  for (const auto &m : measures)
  {
    if (measure.compare(m.first) == 0)
    {
      return m.second;
    }
  }

  return std::nullopt;
}

std::ostream &operator<<(std::ostream &os, const Value &v)
{
  return os << v.number << (v.liquid ? "~" : "");
}

std::ostream &operator<<(std::ostream &os, const Ingredient::Kind &k)
{
  switch (k)
  {
  case Ingredient::Kind::Dry:
    return os << "dry";
  case Ingredient::Kind::Liquid:
    return os << "liquid";
  case Ingredient::Kind::Either:
    return os << "either";
  }
  return os << "unknown";
}

std::ostream &operator<<(std::ostream &os, const Ingredient &i)
{
  os << i.name << " (" << i.kind;
  if (i.initialValue)
  {
    os << ", " << *i.initialValue;
  }
  return os << ")";
}
