#include "token.hpp"

const char* kindToString(const Token::Kind &k)
{
  switch (k)
  {
  #define X(kind, str, is_kw) case Token::Kind::kind: return str;
#include "token_list.hpp"
#undef X
  };
  return "Unknown";
}

const char* Token::toString() const
{
  return kindToString(m_kind);
}

std::ostream &operator<<(std::ostream &os, const Token::Kind &k)
{
  return os << kindToString(k);
}

std::ostream &operator<<(std::ostream &os, const Token::Location &location)
{
  return os << location.line << ":" << location.col;
}

std::ostream &operator<<(std::ostream &os, const Token &t)
{
  // e.g. Word('sugar')@3:12
  if (t.isOneOf(Token::Kind::LineBreak, Token::Kind::BlankLine, Token::Kind::End))
  {
    return os << t.toString() << "@" << t.location();
  }
  return os << t.toString() << "('" << t.lexeme() << "')@" << t.location();
}
