#pragma once
#include "scanner.hpp"
#include "recipe.hpp"

#include <string>
#include <vector>

/*
program        -> BLANK* recipe ( BLANK recipe )* BLANK*
recipe         -> title break comment? ingredients? cooking_time? oven? method serves?
title          -> WORD+ "." break
comment        -> ( WORD | NUMBER | "." )+ BLANK
ingredients    -> "Ingredients" "." LINE ingredient ( LINE ingredient )* BLANK
ingredient     -> NUMBER? ( ( "heaped" | "level" ) measure | measure )? WORD+
measure        -> "g" | "kg" | "pinch" | "pinches" | "ml" | "l" | "dash" | "dashes"
               | "cup" | "cups" | "teaspoon" | "teaspoons" | "tablespoon" | "tablespoons"
cooking_time   -> "Cooking" "time:" NUMBER ( "minute" | "minutes" | "hour" | "hours" ) "." break
oven           -> "Pre-heat" "oven" "to" NUMBER "degrees" "Celsius" gas_mark? "." break
method         -> "Method" "." LINE ( statement "." )+
serves         -> BLANK "Serves" NUMBER "."
break          -> LINE | BLANK

statements are matched by readStatement (phrasebook.hpp). LINE breaks inside
the method are insignificant
*/

class Parser
{
public:
  Parser(Scanner &scanner) : m_scanner(scanner) {}
  std::vector<ParsedRecipe> parse();

private:
  [[noreturn]] void error(const Token &t, const std::string &msg);
  ParsedRecipe recipe();
  std::string title(Token::Location &location);
  std::string comment();
  std::vector<Ingredient> ingredients();
  Ingredient ingredient(const std::vector<Token> &line);
  void cookingTime(ParsedRecipe &recipe);
  void ovenTemperature(ParsedRecipe &recipe);
  Method method();
  std::optional<i64> serves();

  std::vector<Token> line();
  void paragraphBreak(const char *after);
  void sectionBreak(const char *after);
  bool atHeader(Token::Kind kind);
  bool atPhrase(std::string_view first, std::string_view second);

  Scanner m_scanner;
};
