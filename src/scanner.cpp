#include "scanner.hpp"

#include <charconv>
#include <tuple>

char Scanner::get() noexcept
{
  char c = *m_start++;
  m_col++;
  if (c == '\n')
  {
    m_line++;
    m_col = 0;
  }
  return c;
}

Token Scanner::next() noexcept
{
  m_prevStart = m_start;
  m_prevLocation = {m_line, m_col};
  Token t = nextToken();
  return t;
}

void Scanner::goBack()
{
  m_start = m_prevStart;
  m_line = m_prevLocation.line;
  m_col = m_prevLocation.col;
}

enum class CharacterKind
{
  End,
  Puncutation,
  Alphabetical,
  Numeric,
  Unknown,
};

constexpr static CharacterKind classifyChar(char c)
{
  // store min and max ranges for classifications
  constexpr const std::tuple<CharacterKind, char, char> ranges[] = {
      {CharacterKind::End, '\0', '\0'},
      {CharacterKind::Puncutation, '!', '/'},
      {CharacterKind::Numeric, '0', '9'},
      {CharacterKind::Puncutation, ':', '@'},
      {CharacterKind::Alphabetical, 'A', 'Z'},
      {CharacterKind::Puncutation, '[', '`'},
      {CharacterKind::Alphabetical, 'a', 'z'},
      {CharacterKind::Puncutation, '{', '~'},
  };

  for (std::size_t i = 0; i < (sizeof(ranges) / sizeof(ranges[0])); i++)
  {
    if (c >= std::get<1>(ranges[i]) && c <= std::get<2>(ranges[i]))
    {
      return std::get<0>(ranges[i]);
    }
  }

  // anything outside of ascii (utf-8 continuation bytes etc) is part of a word
  return CharacterKind::Unknown;
}

Token Scanner::nextToken() noexcept
{
  while (isWhiteSpace(peek()))
  {
    get();
  }

  const Token::Location location = {m_line, m_col};

  // more in depth state for reading mutli-character tokens
  enum Where
  {
    Number,
    Word,
  } where = Word;

  char c = peek();
  if (c == '\n')
  {
    return lineBreak(location);
  }

  switch (classifyChar(c))
  {
  case CharacterKind::End:
    return Token(Token::Kind::End, m_start, std::size_t(0), location);
  case CharacterKind::Puncutation:
    if (c == '.')
    {
      return charToken(Token::Kind::Period);
    }
    break;
  case CharacterKind::Numeric:
    where = Number;
    break;
  default:
    break;
  }

  const char *tokenStart = m_start;

  while (true)
  {
    c = peek();
    const CharacterKind kind = classifyChar(c);

    if (kind == CharacterKind::End || c == '\n' || isWhiteSpace(c) || c == '.')
    {
      break;
    }

    // a number running into anything else (1st, 2nd, 3-4) is a word
    if (where == Number && kind != CharacterKind::Numeric)
    {
      where = Word;
    }

    get();
  }

  if (where == Word)
  {
    return wordOrReserved(tokenStart, m_start, location);
  }

  Token token = Token(Token::Kind::Number, tokenStart, m_start, location);
  const auto [ptr, ec] = std::from_chars(tokenStart, m_start, token.value.number);
  if (ec != std::errc() || ptr != m_start)
  {
    token.setKind(Token::Kind::Unexpected);
  }
  return token;
}

// consumes a run of line breaks. more than one (ignoring horizontal whitespace
// between them) separates paragraphs
Token Scanner::lineBreak(Token::Location location) noexcept
{
  const char *tokenStart = m_start;
  get();

  int nBreaks = 1;
  while (true)
  {
    const char *lookahead = m_start;
    while (isWhiteSpace(*lookahead))
    {
      lookahead++;
    }
    if (*lookahead != '\n')
    {
      break;
    }

    while (m_start != lookahead)
    {
      get();
    }
    get();
    nBreaks++;
  }

  const Token::Kind kind = nBreaks > 1 ? Token::Kind::BlankLine : Token::Kind::LineBreak;
  return Token(kind, tokenStart, m_start, location);
}

struct ReservedWord
{
  const char *str;
  Token::Kind kind;
};
inline constexpr ReservedWord reserved[] = {
#define RESERVED_true(str, kind) {str, Token::Kind::kind},
#define RESERVED_false(str, kind) // empty
#define X(kind, str, is_kw) RESERVED_##is_kw(str, kind)
#include "token_list.hpp"
#undef X
#undef RESERVED_true
#undef RESERVED_false
};

Token Scanner::wordOrReserved(const char *start,
                              const char *end, Token::Location location) const noexcept
{
  std::string_view lexeme = std::string_view(start, end - start);
  const size_t nReserved = sizeof(reserved) / sizeof(reserved[0]);
  for (size_t i = 0; i < nReserved; i++)
  {
    if (lexeme.compare(reserved[i].str) == 0)
    {
      return Token(reserved[i].kind, start, end, location);
    }
  }
  return Token(Token::Kind::Word, start, end, location);
}

Token Scanner::peekToken() noexcept
{
  int prevLine = m_line;
  int prevCol = m_col;
  const char *prev = m_start;
  const char *prevStart = m_prevStart;
  const Token::Location prevLocation = m_prevLocation;
  Token t = next();
  m_start = prev;
  m_line = prevLine;
  m_col = prevCol;
  m_prevStart = prevStart;
  m_prevLocation = prevLocation;
  return t;
}

// new lines are significant so they are not whitespace
bool Scanner::isWhiteSpace(char c) const noexcept { return c > 0 && c <= ' ' && c != '\n'; }

Token Scanner::charToken(Token::Kind kind) noexcept
{
  const Token::Location location = {m_line, m_col};
  const char *start = m_start;
  get();
  return Token(kind, start, 1, location);
}
