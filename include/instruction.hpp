#pragma once

#include "common.hpp"
#include "token.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct Instruction
{
  enum Opcode
  {
    Read = 0,        // ingredient = input
    Push,            // bowl.push(ingredient)
    Pop,             // ingredient = bowl.pop()
    Add,             // bowl.top += ingredient
    Subtract,        // bowl.top -= ingredient
    Multiply,        // bowl.top *= ingredient
    Divide,          // bowl.top /= ingredient
    AddDry,          // bowl.push(sum of dry ingredients)
    Liquefy,         // ingredient.liquid = true
    LiquefyContents, // bowl[*].liquid = true
    Stir,            // sink bowl.top by count
    StirIngredient,  // sink bowl.top by ingredient
    Mix,             // shuffle bowl
    ClearStack,      // bowl = {}
    CopyStack,       // dish.push(bowl...)
    LoopStart,
    LoopEnd,
    Break,
    Call,
    Return,
    PrintStacks,
  } op;

  explicit Instruction(Opcode op, Token::Location location = {}) : op(op), location(location) {}

  // operands, unused ones keep their defaults
  std::string ingredient;
  std::string name;    // recipe for Call, verb for LoopStart and LoopEnd
  std::string keyword; // loop closing word, e.g. "sifted"
  u32 bowl = 1;
  u32 dish = 1;
  std::optional<i64> count; // minutes, hours or dishes served

  // resolved by the builder: the partner of a loop statement, or the loop end
  // a Break leaves through
  std::size_t target = 0;

  Token::Location location;

  // the source location is not part of what an instruction does
  bool operator==(const Instruction &b) const
  {
    return op == b.op && ingredient == b.ingredient && name == b.name && keyword == b.keyword &&
           bowl == b.bowl && dish == b.dish && count == b.count && target == b.target;
  }
};

using Method = std::vector<Instruction>;

const char *opcodeToString(Instruction::Opcode op);

std::ostream &operator<<(std::ostream &os, const Instruction &i);
