#pragma once

#include "kitchen.hpp"
#include "recipe.hpp"

#include <iostream>
#include <optional>
#include <random>
#include <string>

class Runner
{
public:
  struct Settings
  {
    // shuffles for "Mix well", std::random_device when not set
    std::optional<u32> seed;
    // deepest chain of "Serve with" allowed, 0 for no limit
    u32 maxDepth = 0;
  };

  Runner(const Program &program, std::istream &input, std::ostream &output)
    : Runner(program, input, output, Settings{}) {}
  Runner(const Program &program, std::istream &input, std::ostream &output, Settings settings);

  // cook the main recipe. throws RunError
  void run();
  // cook whatever recipe `frame` was made for, leaving its bowls behind
  void cook(Frame &frame, u32 depth = 0);

private:
  bool step(Frame &frame, const Instruction &ins, u32 depth);
  void call(Frame &caller, const Instruction &ins, u32 depth);
  void serve(Frame &frame, i64 dishes);
  void emit(const Frame &frame, const Value &v);
  i64 read(const Frame &frame);

  const Program &m_program;
  std::istream &m_input;
  std::ostream &m_output;
  Settings m_settings;
  std::mt19937 m_rng;
};

// the utf-8 encoding of a code point, std::nullopt if it is not one
std::optional<std::string> encodeCodePoint(i64 codePoint);
