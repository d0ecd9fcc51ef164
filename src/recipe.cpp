#include "recipe.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string recipeKey(std::string_view name)
{
  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return key;
}

const Recipe &Program::main() const
{
  const Recipe *recipe = find(mainRecipe);
  if (recipe == nullptr)
  {
    throw std::out_of_range("Program has no main recipe");
  }
  return *recipe;
}

const Recipe *Program::find(std::string_view name) const noexcept
{
  const auto it = recipes.find(recipeKey(name));
  if (it == recipes.end())
  {
    return nullptr;
  }
  return &it->second;
}
