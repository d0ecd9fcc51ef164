#pragma once

#include "recipe.hpp"

#include <string>
#include <string_view>
#include <vector>

// turns parsed recipes into a program that can be run: loops are paired,
// breaks know where they leave to and every "Serve with" names a recipe
class ProgramBuilder
{
public:
  Program build(const std::vector<ParsedRecipe> &parsed);

private:
  Recipe assemble(const ParsedRecipe &parsed);
  void resolveLoops(Recipe &recipe);
  void checkCalls(const Program &program);
};

// "Sift" -> "sifted", "Shake" -> "shaked"
std::string closingKeyword(std::string_view verb);

// parse and build in one go
Program loadProgram(const char *text);
