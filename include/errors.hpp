#pragma once

#include "token.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

// malformed recipe text
struct ParseError : public std::runtime_error
{
  ParseError(Token::Location location, const std::string &msg)
    : std::runtime_error((std::stringstream() << location << " " << msg).str()), location(location)
  {
  }

  Token::Location location;
};

// recipes that read fine but do not fit together
struct BuildError : public std::runtime_error
{
  BuildError(const std::string &recipe, const std::string &msg)
    : std::runtime_error((std::stringstream() << "in '" << recipe << "': " << msg).str()), recipe(recipe)
  {
  }

  std::string recipe;
};

// something went wrong in the kitchen
struct RunError : public std::runtime_error
{
  RunError(const std::string &recipe, const std::string &msg)
    : std::runtime_error((std::stringstream() << "in '" << recipe << "': " << msg).str()), recipe(recipe)
  {
  }

  std::string recipe;
};
