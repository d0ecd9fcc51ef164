#pragma once

#include "recipe.hpp"
#include "value.hpp"

#include <map>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// a mixing bowl or baking dish. the back of the vector is the top
class Stack
{
public:
  Stack() = default;
  Stack(std::initializer_list<Value> values) : m_values(values) {}

  void push(Value v) { m_values.push_back(v); }
  Value pop();
  Value &top();

  // sink the top value `depth` places, or to the bottom if the stack is shallower
  void stir(std::size_t depth);
  void shuffle(std::mt19937 &rng);
  void liquefy() noexcept;
  void clear() noexcept { m_values.clear(); }
  // put a copy of every value onto `dish`, keeping their order
  void pourInto(Stack &dish) const;

  bool empty() const noexcept { return m_values.empty(); }
  std::size_t size() const noexcept { return m_values.size(); }
  // bottom first
  std::span<const Value> contents() const noexcept { return m_values; }

  bool operator==(const Stack &) const = default;

private:
  std::vector<Value> m_values;
};

// the state of one recipe while it is being cooked
struct Frame
{
  struct Binding
  {
    Value value;
    Ingredient::Kind kind;
  };

  explicit Frame(const Recipe &recipe);

  Stack &bowl(u32 n) { return bowls[n]; }
  Stack &dish(u32 n) { return dishes[n]; }

  // throws std::out_of_range for an ingredient the recipe never declared
  Binding &ingredient(std::string_view name);
  // total of every dry ingredient
  i64 dryTotal() const noexcept;

  const Recipe &recipe;
  std::map<u32, Stack> bowls;
  std::map<u32, Stack> dishes;
  std::unordered_map<std::string, Binding> ingredients;
  std::size_t ip = 0;
};
