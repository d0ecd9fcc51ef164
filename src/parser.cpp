#include <charconv>
#include <optional>
#include <span>

#include "parser.hpp"
#include "phrasebook.hpp"
#include "errors.hpp"

void Parser::error(const Token &t, const std::string &msg)
{
  std::cerr << t.location() << " " << msg << std::endl;
  throw ParseError(t.location(), msg);
}

std::vector<ParsedRecipe> Parser::parse()
{
  while (m_scanner.peekToken().isOneOf(Token::Kind::LineBreak, Token::Kind::BlankLine))
  {
    m_scanner.next();
  }

  if (m_scanner.peekToken().is(Token::Kind::End))
  {
    error(m_scanner.peekToken(), "Expected a recipe");
  }

  std::vector<ParsedRecipe> recipes = {recipe()};

  while (true)
  {
    bool separated = false;
    Token t = m_scanner.next();
    while (t.isOneOf(Token::Kind::LineBreak, Token::Kind::BlankLine))
    {
      separated = separated || t.is(Token::Kind::BlankLine);
      t = m_scanner.next();
    }

    if (t.is(Token::Kind::End))
    {
      break;
    }
    if (!separated)
    {
      error(t, std::string("Expected a blank line before the next recipe, instead saw ") + t.toString());
    }

    m_scanner.goBack();
    recipes.push_back(recipe());
  }

  return recipes;
}

ParsedRecipe Parser::recipe()
{
  ParsedRecipe recipe;
  recipe.title = title(recipe.location);
  sectionBreak("the recipe title");

  if (!atHeader(Token::Kind::Ingredients) && !atHeader(Token::Kind::Method) &&
      !atPhrase("Cooking", "time:") && !atPhrase("Pre-heat", "oven"))
  {
    recipe.comment = comment();
    paragraphBreak("the comments");
  }

  if (atHeader(Token::Kind::Ingredients))
  {
    recipe.ingredients = ingredients();
    paragraphBreak("the ingredient list");
  }

  if (atPhrase("Cooking", "time:"))
  {
    cookingTime(recipe);
    sectionBreak("the cooking time");
  }

  if (atPhrase("Pre-heat", "oven"))
  {
    ovenTemperature(recipe);
    sectionBreak("the oven temperature");
  }

  recipe.method = method();
  recipe.serves = serves();
  return recipe;
}

// tokens up to (not including) the next line break
std::vector<Token> Parser::line()
{
  std::vector<Token> tokens;
  while (true)
  {
    Token t = m_scanner.next();
    if (t.isBreak())
    {
      m_scanner.goBack();
      return tokens;
    }
    tokens.push_back(t);
  }
}

void Parser::paragraphBreak(const char *after)
{
  Token t = m_scanner.next();
  if (!t.is(Token::Kind::BlankLine))
  {
    error(t, std::string("Expected a blank line after ") + after + ", instead saw " + t.toString());
  }
}

void Parser::sectionBreak(const char *after)
{
  Token t = m_scanner.next();
  if (!t.isOneOf(Token::Kind::LineBreak, Token::Kind::BlankLine))
  {
    error(t, std::string("Expected a new line after ") + after + ", instead saw " + t.toString());
  }
}

// e.g. "Method." at the start of a paragraph
bool Parser::atHeader(Token::Kind kind)
{
  Scanner probe = m_scanner;
  return probe.next().is(kind) && probe.next().is(Token::Kind::Period);
}

bool Parser::atPhrase(std::string_view first, std::string_view second)
{
  Scanner probe = m_scanner;
  const Token a = probe.next();
  const Token b = probe.next();
  return a.isWord() && a.lexeme() == first && b.isWord() && b.lexeme() == second;
}

std::string Parser::title(Token::Location &location)
{
  const std::vector<Token> tokens = line();
  if (tokens.empty())
  {
    error(m_scanner.peekToken(), "Expected a recipe title");
  }
  if (tokens.size() < 2 || !tokens.back().is(Token::Kind::Period))
  {
    error(tokens.back(), "Expected '.' at the end of the recipe title");
  }

  const std::span<const Token> words = std::span<const Token>(tokens).first(tokens.size() - 1);
  for (const Token &t : words)
  {
    if (t.isOneOf(Token::Kind::Period, Token::Kind::Unexpected))
    {
      error(t, std::string("Unexpected ") + t.toString() + " in the recipe title");
    }
  }

  location = tokens.front().location();
  return joinWords(words);
}

std::string Parser::comment()
{
  const char *start = nullptr;
  const char *end = nullptr;

  while (true)
  {
    Token t = m_scanner.next();
    if (t.isOneOf(Token::Kind::BlankLine, Token::Kind::End))
    {
      m_scanner.goBack();
      break;
    }
    if (t.is(Token::Kind::LineBreak))
    {
      continue;
    }

    if (start == nullptr)
    {
      start = t.begin();
    }
    end = t.end();
  }

  if (start == nullptr)
  {
    return "";
  }
  return std::string(start, end);
}

std::vector<Ingredient> Parser::ingredients()
{
  m_scanner.next(); // Ingredients
  m_scanner.next(); // .

  Token t = m_scanner.next();
  if (!t.is(Token::Kind::LineBreak))
  {
    error(t, std::string("Expected a new line after 'Ingredients.', instead saw ") + t.toString());
  }

  std::vector<Ingredient> result;
  while (true)
  {
    const std::vector<Token> tokens = line();
    if (tokens.empty())
    {
      error(m_scanner.peekToken(), "Expected an ingredient");
    }
    result.push_back(ingredient(tokens));

    if (!m_scanner.peekToken().is(Token::Kind::LineBreak))
    {
      break;
    }
    m_scanner.next();
  }

  return result;
}

Ingredient Parser::ingredient(const std::vector<Token> &tokens)
{
  for (const Token &t : tokens)
  {
    if (t.isOneOf(Token::Kind::Period, Token::Kind::Unexpected))
    {
      error(t, std::string("Unexpected ") + t.toString() + " in ingredient");
    }
  }

  Ingredient result;
  std::size_t i = 0;
  const std::size_t n = tokens.size();

  if (tokens[i].is(Token::Kind::Number))
  {
    result.initialValue = tokens[i].value.number;
    i++;
  }

  if (i < n && (tokens[i].lexeme() == "heaped" || tokens[i].lexeme() == "level"))
  {
    i++;
    if (i + 1 >= n || !measureKind(tokens[i].lexeme()))
    {
      const Token &at = i < n ? tokens[i] : tokens.back();
      error(at, std::string("Unrecognised measure '") + std::string(at.lexeme()) + "'");
    }
    result.kind = Ingredient::Kind::Dry;
    i++;
  }
  else if (i + 1 < n)
  {
    // only a measure when there is still a name after it
    if (const auto kind = measureKind(tokens[i].lexeme()))
    {
      result.kind = *kind;
      i++;
    }
  }

  if (i >= n)
  {
    error(tokens.back(), "Expected an ingredient name");
  }

  result.name = joinWords(std::span<const Token>(tokens).subspan(i));
  return result;
}

void Parser::cookingTime(ParsedRecipe &recipe)
{
  const std::vector<Token> tokens = line();
  static const char *units[] = {"minute", "minutes", "hour", "hours"};

  bool valid = tokens.size() == 5 && tokens[1].lexeme() == "time:" &&
               tokens[2].is(Token::Kind::Number) && tokens[4].is(Token::Kind::Period);
  if (valid)
  {
    valid = false;
    for (const char *unit : units)
    {
      valid = valid || tokens[3].lexeme() == unit;
    }
  }

  if (!valid)
  {
    error(tokens.front(), "Expected 'Cooking time: <number> minutes.'");
  }
  recipe.cookingTime = tokens[2].value.number;
}

void Parser::ovenTemperature(ParsedRecipe &recipe)
{
  const std::vector<Token> tokens = line();

  // Pre-heat oven to 180 degrees Celsius (gas mark 4).
  const bool valid = (tokens.size() == 7 || tokens.size() == 10) && tokens[1].lexeme() == "oven" &&
                     tokens[2].lexeme() == "to" && tokens[3].is(Token::Kind::Number) &&
                     tokens[4].lexeme() == "degrees" && tokens[5].lexeme() == "Celsius" &&
                     tokens.back().is(Token::Kind::Period);
  if (!valid)
  {
    error(tokens.front(), "Expected 'Pre-heat oven to <number> degrees Celsius.'");
  }
  recipe.ovenTemperature = tokens[3].value.number;

  if (tokens.size() == 10)
  {
    const std::string_view mark = tokens[8].lexeme();
    i64 gasMark = 0;
    const auto [ptr, ec] = std::from_chars(mark.data(), mark.data() + mark.size(), gasMark);
    if (tokens[6].lexeme() != "(gas" || tokens[7].lexeme() != "mark" || ec != std::errc() ||
        std::string_view(ptr, mark.data() + mark.size()) != ")")
    {
      error(tokens[6], "Expected '(gas mark <number>)'");
    }
    recipe.gasMark = gasMark;
  }
}

Method Parser::method()
{
  if (!atHeader(Token::Kind::Method))
  {
    error(m_scanner.peekToken(), std::string("Expected 'Method.', instead saw ") + m_scanner.peekToken().toString());
  }
  m_scanner.next(); // Method
  m_scanner.next(); // .

  Token t = m_scanner.next();
  if (!t.is(Token::Kind::LineBreak))
  {
    error(t, std::string("Expected a new line after 'Method.', instead saw ") + t.toString());
  }

  Method result;
  std::vector<Token> sentence;
  while (true)
  {
    t = m_scanner.next();
    if (t.is(Token::Kind::LineBreak))
    {
      continue;
    }
    if (t.isOneOf(Token::Kind::BlankLine, Token::Kind::End))
    {
      if (!sentence.empty())
      {
        error(sentence.back(), "Expected '.' at the end of the statement");
      }
      m_scanner.goBack();
      break;
    }
    if (t.is(Token::Kind::Unexpected))
    {
      error(t, std::string("Unexpected '") + std::string(t.lexeme()) + "'");
    }
    if (sentence.empty() && t.is(Token::Kind::Serves))
    {
      // serves straight after the last statement
      m_scanner.goBack();
      break;
    }
    if (!t.is(Token::Kind::Period))
    {
      sentence.push_back(t);
      continue;
    }

    if (sentence.empty())
    {
      error(t, "Expected a statement before '.'");
    }

    std::optional<Instruction> instruction;
    try
    {
      instruction = readStatement(sentence);
    }
    catch (const ParseError &e)
    {
      std::cerr << e.what() << std::endl;
      throw;
    }

    if (!instruction)
    {
      error(sentence.front(), "Unrecognised statement '" + joinWords(sentence) + "'");
    }
    result.push_back(std::move(*instruction));
    sentence.clear();
  }

  if (result.empty())
  {
    error(t, "Expected at least one statement after 'Method.'");
  }
  return result;
}

std::optional<i64> Parser::serves()
{
  Token t = m_scanner.next();
  if (t.is(Token::Kind::BlankLine))
  {
    if (!m_scanner.peekToken().is(Token::Kind::Serves))
    {
      m_scanner.goBack();
      return std::nullopt;
    }
    t = m_scanner.next();
  }
  else if (!t.is(Token::Kind::Serves))
  {
    m_scanner.goBack();
    return std::nullopt;
  }

  const Token count = m_scanner.next();
  if (!count.is(Token::Kind::Number) || count.value.number < 1)
  {
    error(count, "Expected the number of diners after 'Serves'");
  }
  const Token period = m_scanner.next();
  if (!period.is(Token::Kind::Period))
  {
    error(period, "Expected '.' after the number of diners");
  }
  if (!m_scanner.peekToken().isBreak())
  {
    error(m_scanner.peekToken(), "Expected a new line after 'Serves'");
  }

  return count.value.number;
}
