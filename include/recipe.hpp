#pragma once

#include "instruction.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// one recipe as written, before loops and calls are resolved
struct ParsedRecipe
{
  std::string title;
  Token::Location location;
  std::string comment;
  std::vector<Ingredient> ingredients;
  // accepted for the sake of the recipe, they change nothing
  std::optional<i64> cookingTime;
  std::optional<i64> ovenTemperature;
  std::optional<i64> gasMark;
  Method method;
  std::optional<i64> serves;
};

struct Recipe
{
  std::string name;
  std::vector<Ingredient> ingredients;
  Method instructions;
};

struct Program
{
  // keyed by recipeKey(name)
  std::map<std::string, Recipe> recipes;
  std::string mainRecipe;

  const Recipe &main() const;
  const Recipe *find(std::string_view name) const noexcept;
};

// recipe titles are matched without regard to case
std::string recipeKey(std::string_view name);
