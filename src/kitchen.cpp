#include "kitchen.hpp"

#include <algorithm>
#include <stdexcept>

Value Stack::pop()
{
  if (m_values.empty())
  {
    throw std::out_of_range("Cannot take anything out of an empty bowl");
  }
  const Value v = m_values.back();
  m_values.pop_back();
  return v;
}

Value &Stack::top()
{
  if (m_values.empty())
  {
    throw std::out_of_range("There is nothing on top of an empty bowl");
  }
  return m_values.back();
}

void Stack::stir(std::size_t depth)
{
  const Value v = pop();
  const std::size_t at = depth >= m_values.size() ? 0 : m_values.size() - depth;
  m_values.insert(m_values.begin() + static_cast<std::ptrdiff_t>(at), v);
}

void Stack::shuffle(std::mt19937 &rng)
{
  std::shuffle(m_values.begin(), m_values.end(), rng);
}

void Stack::liquefy() noexcept
{
  for (Value &v : m_values)
  {
    v.liquid = true;
  }
}

void Stack::pourInto(Stack &dish) const
{
  dish.m_values.insert(dish.m_values.end(), m_values.begin(), m_values.end());
}

Frame::Frame(const Recipe &recipe)
: recipe(recipe)
{
  for (const Ingredient &i : recipe.ingredients)
  {
    ingredients[i.name] = Binding{i.initial(), i.kind};
  }
}

Frame::Binding &Frame::ingredient(std::string_view name)
{
  const auto it = ingredients.find(std::string(name));
  if (it == ingredients.end())
  {
    throw std::out_of_range("'" + std::string(name) + "' is not one of the ingredients");
  }
  return it->second;
}

i64 Frame::dryTotal() const noexcept
{
  // wraps around like the rest of the arithmetic
  std::uint64_t total = 0;
  for (const auto &[name, binding] : ingredients)
  {
    if (binding.kind == Ingredient::Kind::Dry)
    {
      total += static_cast<std::uint64_t>(binding.value.number);
    }
  }
  return static_cast<i64>(total);
}
