#include "phrasebook.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>
#include <vector>

namespace
{

using Elements = std::vector<std::string_view>;

Elements splitPattern(std::string_view pattern)
{
  Elements elements;
  std::size_t start = 0;
  while (start < pattern.size())
  {
    std::size_t end = pattern.find(' ', start);
    if (end == std::string_view::npos)
    {
      end = pattern.size();
    }
    elements.push_back(pattern.substr(start, end - start));
    start = end + 1;
  }
  return elements;
}

bool matchFrom(const Elements &elements, std::size_t p, std::span<const Token> s, std::size_t t,
               Captures &captures);

std::optional<u32> vesselNumber(const Token &t) noexcept
{
  if (!t.is(Token::Kind::Number) || t.value.number < 1 ||
      t.value.number > std::numeric_limits<u32>::max())
  {
    return std::nullopt;
  }
  return static_cast<u32>(t.value.number);
}

// [the] [<nth>] <noun> <kind> [<n>], e.g. "the 2nd mixing bowl" or "mixing bowl 2"
bool matchVessel(const Elements &elements, std::size_t p, std::span<const Token> s, std::size_t t,
                 Captures &captures, std::string_view noun, std::string_view kind,
                 std::optional<u32> &slot)
{
  std::vector<std::size_t> afterThe = {t};
  if (t < s.size() && s[t].lexeme() == "the")
  {
    afterThe.insert(afterThe.begin(), t + 1);
  }

  for (const std::size_t tt : afterThe)
  {
    std::vector<std::pair<std::size_t, std::optional<u32>>> afterOrdinal = {{tt, std::nullopt}};
    if (tt < s.size())
    {
      if (const auto ordinal = ordinalValue(s[tt].lexeme()))
      {
        afterOrdinal.insert(afterOrdinal.begin(), std::make_pair(tt + 1, ordinal));
      }
    }

    for (const auto &[ti, ordinal] : afterOrdinal)
    {
      if (ti + 1 >= s.size() || s[ti].lexeme() != noun || s[ti + 1].lexeme() != kind)
      {
        continue;
      }

      const std::size_t after = ti + 2;
      if (!ordinal && after < s.size())
      {
        if (const auto number = vesselNumber(s[after]))
        {
          slot = number;
          if (matchFrom(elements, p + 1, s, after + 1, captures))
          {
            return true;
          }
        }
      }

      slot = ordinal.value_or(1);
      if (matchFrom(elements, p + 1, s, after, captures))
      {
        return true;
      }
    }
  }

  slot = std::nullopt;
  return false;
}

// one or more words, shortest first
bool matchWords(const Elements &elements, std::size_t p, std::span<const Token> s, std::size_t t,
                Captures &captures, std::string &slot)
{
  for (std::size_t end = t + 1; end <= s.size(); end++)
  {
    slot = joinWords(s.subspan(t, end - t));
    if (matchFrom(elements, p + 1, s, end, captures))
    {
      return true;
    }
  }
  slot.clear();
  return false;
}

bool matchFrom(const Elements &elements, std::size_t p, std::span<const Token> s, std::size_t t,
               Captures &captures)
{
  if (p == elements.size())
  {
    return t == s.size();
  }

  const std::string_view element = elements[p];

  if (element == "<ing>")
  {
    return matchWords(elements, p, s, t, captures, captures.ingredient);
  }
  if (element == "<recipe>")
  {
    return matchWords(elements, p, s, t, captures, captures.recipe);
  }
  if (element == "<bowl>")
  {
    return matchVessel(elements, p, s, t, captures, "mixing", "bowl", captures.bowl);
  }
  if (element == "<dish>")
  {
    return matchVessel(elements, p, s, t, captures, "baking", "dish", captures.dish);
  }

  if (t >= s.size())
  {
    // only optional words can match nothing
    return element.ends_with('?') && matchFrom(elements, p + 1, s, t, captures);
  }

  const Token &token = s[t];
  if (element == "<verb>" || element == "<verbed>")
  {
    if (!token.isWord())
    {
      return false;
    }
    (element == "<verb>" ? captures.verb : captures.verbed) = std::string(token.lexeme());
    return matchFrom(elements, p + 1, s, t + 1, captures);
  }
  if (element == "<n>")
  {
    if (!token.is(Token::Kind::Number))
    {
      return false;
    }
    captures.number = token.value.number;
    return matchFrom(elements, p + 1, s, t + 1, captures);
  }

  if (element.ends_with('?'))
  {
    const std::string_view word = element.substr(0, element.size() - 1);
    if (token.lexeme() == word && matchFrom(elements, p + 1, s, t + 1, captures))
    {
      return true;
    }
    return matchFrom(elements, p + 1, s, t, captures);
  }

  return token.lexeme() == element && matchFrom(elements, p + 1, s, t + 1, captures);
}

enum class Agreement
{
  None,
  Singular, // "1 hour"
  Plural,   // "2 hours"
};

struct Phrase
{
  const char *pattern;
  Instruction::Opcode op;
  Agreement agreement = Agreement::None;
};

// more specific phrasings come before the ones that would swallow them
const Phrase phrases[] = {
  {"Take <ing> from the? refrigerator", Instruction::Opcode::Read},
  {"Put <ing> into <bowl>", Instruction::Opcode::Push},
  {"Fold <ing> into <bowl>", Instruction::Opcode::Pop},
  {"Add dry ingredients to <bowl>", Instruction::Opcode::AddDry},
  {"Add dry ingredients", Instruction::Opcode::AddDry},
  {"Add <ing> to <bowl>", Instruction::Opcode::Add},
  {"Remove <ing> from <bowl>", Instruction::Opcode::Subtract},
  {"Combine <ing> into <bowl>", Instruction::Opcode::Multiply},
  {"Divide <ing> into <bowl>", Instruction::Opcode::Divide},
  {"Add <ing>", Instruction::Opcode::Add},
  {"Remove <ing>", Instruction::Opcode::Subtract},
  {"Combine <ing>", Instruction::Opcode::Multiply},
  {"Divide <ing>", Instruction::Opcode::Divide},
  {"Liquefy contents of <bowl>", Instruction::Opcode::LiquefyContents},
  {"Liquify contents of <bowl>", Instruction::Opcode::LiquefyContents},
  {"Liquefy <ing>", Instruction::Opcode::Liquefy},
  {"Liquify <ing>", Instruction::Opcode::Liquefy},
  {"Stir <bowl> for <n> minute", Instruction::Opcode::Stir, Agreement::Singular},
  {"Stir <bowl> for <n> minutes", Instruction::Opcode::Stir, Agreement::Plural},
  {"Stir for <n> minute", Instruction::Opcode::Stir, Agreement::Singular},
  {"Stir for <n> minutes", Instruction::Opcode::Stir, Agreement::Plural},
  {"Stir <ing> into <bowl>", Instruction::Opcode::StirIngredient},
  {"Mix <bowl> well", Instruction::Opcode::Mix},
  {"Mix well", Instruction::Opcode::Mix},
  {"Clean <bowl>", Instruction::Opcode::ClearStack},
  {"Pour contents of <bowl> into <dish>", Instruction::Opcode::CopyStack},
  {"Set aside", Instruction::Opcode::Break},
  {"Serve with <recipe>", Instruction::Opcode::Call},
  {"Refrigerate", Instruction::Opcode::Return},
  {"Refrigerate for <n> hour", Instruction::Opcode::Return, Agreement::Singular},
  {"Refrigerate for <n> hours", Instruction::Opcode::Return, Agreement::Plural},
  {"<verb> the? <ing> until <verbed>", Instruction::Opcode::LoopEnd},
  {"<verb> until <verbed>", Instruction::Opcode::LoopEnd},
  {"<verb> the <ing>", Instruction::Opcode::LoopStart},
};

std::string lowered(std::string_view word)
{
  std::string s(word);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void checkAgreement(const Phrase &phrase, const Captures &captures, Token::Location location)
{
  const i64 n = captures.number.value_or(0);
  if (phrase.agreement == Agreement::Singular && n != 1)
  {
    throw ParseError(location, std::to_string(n) + " does not agree with a singular unit");
  }
  if (phrase.agreement == Agreement::Plural && n == 1)
  {
    throw ParseError(location, "1 does not agree with a plural unit");
  }
  if (phrase.op == Instruction::Opcode::Return && captures.number && n < 1)
  {
    throw ParseError(location, "Cannot refrigerate for less than an hour");
  }
  if (phrase.op == Instruction::Opcode::Stir && n < 0)
  {
    throw ParseError(location, "Cannot stir for negative minutes");
  }
}

}

std::string joinWords(std::span<const Token> tokens)
{
  std::string joined;
  for (const Token &t : tokens)
  {
    if (!joined.empty())
    {
      joined += ' ';
    }
    joined += t.lexeme();
  }
  return joined;
}

std::optional<u32> ordinalValue(std::string_view word) noexcept
{
  if (word.size() < 3)
  {
    return std::nullopt;
  }

  const std::string_view suffix = word.substr(word.size() - 2);
  if (suffix != "st" && suffix != "nd" && suffix != "rd" && suffix != "th")
  {
    return std::nullopt;
  }

  const std::string_view digits = word.substr(0, word.size() - 2);
  u32 value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size() || value == 0)
  {
    return std::nullopt;
  }
  return value;
}

bool matchPhrase(std::string_view pattern, std::span<const Token> sentence, Captures &captures)
{
  return matchFrom(splitPattern(pattern), 0, sentence, 0, captures);
}

std::optional<Instruction> readStatement(std::span<const Token> sentence)
{
  if (sentence.empty())
  {
    return std::nullopt;
  }

  static const std::vector<Elements> compiled = [] {
    std::vector<Elements> all;
    for (const Phrase &phrase : phrases)
    {
      all.push_back(splitPattern(phrase.pattern));
    }
    return all;
  }();

  const Token::Location location = sentence.front().location();

  for (std::size_t i = 0; i < compiled.size(); i++)
  {
    Captures captures;
    if (!matchFrom(compiled[i], 0, sentence, 0, captures))
    {
      continue;
    }

    const Phrase &phrase = phrases[i];
    checkAgreement(phrase, captures, location);

    Instruction ins(phrase.op, location);
    ins.ingredient = captures.ingredient;
    ins.bowl = captures.bowl.value_or(1);
    ins.dish = captures.dish.value_or(1);
    switch (phrase.op)
    {
    case Instruction::Opcode::Stir:
    case Instruction::Opcode::Return:
      ins.count = captures.number;
      break;
    case Instruction::Opcode::Call:
      ins.name = captures.recipe;
      break;
    case Instruction::Opcode::LoopStart:
      ins.name = captures.verb;
      break;
    case Instruction::Opcode::LoopEnd:
      ins.name = captures.verb;
      ins.keyword = lowered(captures.verbed);
      break;
    default:
      break;
    }
    return ins;
  }

  return std::nullopt;
}
