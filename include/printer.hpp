#pragma once

#include "instruction.hpp"
#include "recipe.hpp"

#include <ostream>
#include <sstream>
#include <string>

// writes instructions back out as method statements
struct RecipePrinter
{
  std::string print(const Instruction &ins);

private:
  void bowl(u32 n);
  void dish(u32 n);
  template <typename T>
  void write(const T &str);
  std::stringstream output;
};

// every recipe with its numbered instructions, for --dump
void dumpProgram(std::ostream &os, const Program &program);
