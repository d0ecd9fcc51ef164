#pragma once

#include "instruction.hpp"
#include "token.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

/*
Method statements, tried in order, first match wins:

  Take <ing> from [the] refrigerator
  Put <ing> into <bowl>
  Fold <ing> into <bowl>
  Add dry ingredients [to <bowl>]
  Add <ing> to <bowl>
  Remove <ing> from <bowl>
  Combine <ing> into <bowl>
  Divide <ing> into <bowl>
  Add|Remove|Combine|Divide <ing>
  Liquefy|Liquify contents of <bowl>
  Liquefy|Liquify <ing>
  Stir [<bowl>] for <n> minute(s)
  Stir <ing> into <bowl>
  Mix [<bowl>] well
  Clean <bowl>
  Pour contents of <bowl> into <dish>
  Set aside
  Serve with <recipe>
  Refrigerate [for <n> hour(s)]
  <verb> [the] [<ing>] until <verbed>
  <verb> the <ing>

<bowl> -> [the] [<nth>] mixing bowl [<n>]
<dish> -> [the] [<nth>] baking dish [<n>]
*/

// what the placeholders of a phrase picked out of a sentence
struct Captures
{
  std::string ingredient;
  std::string verb;
  std::string verbed;
  std::string recipe;
  std::optional<i64> number;
  std::optional<u32> bowl;
  std::optional<u32> dish;
};

// match a single pattern against a sentence, e.g. "Put <ing> into <bowl>"
bool matchPhrase(std::string_view pattern, std::span<const Token> sentence, Captures &captures);

// turn a sentence (the tokens before its period) into an instruction.
// std::nullopt if no phrase matches, throws ParseError on a phrase that
// matches but does not make sense (e.g. "for 2 hour")
std::optional<Instruction> readStatement(std::span<const Token> sentence);

// join the lexemes of a run of tokens with single spaces
std::string joinWords(std::span<const Token> tokens);

// "3rd" -> 3
std::optional<u32> ordinalValue(std::string_view word) noexcept;
