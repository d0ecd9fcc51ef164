#pragma once

#include "common.hpp"

#include <optional>
#include <string>

struct Options
{
  std::string recipePath;
  // "Take ... from refrigerator" reads from here instead of stdin
  std::string inputPath;
  std::optional<u32> seed;
  // deepest chain of "Serve with" before cooking stops, 0 for no limit
  u32 maxDepth = 1000;
  bool dump = false;
  bool help = false;
};

// throws std::invalid_argument on anything it does not understand
Options parseOptions(int argc, const char *const argv[]);

const char *usage();
