#pragma once

#include "common.hpp"

#include <string_view>
#include <iostream>
#include <stdexcept>

struct Token
{
  struct Location
  {
    int line, col;

    bool operator==(const Location &) const = default;
  };

  enum class Kind
  {
    #define X(kind, str, is_kw) kind,
#include "token_list.hpp"
    #undef X
  };

  Token() noexcept : m_kind(Token::Kind::End), m_lexeme(), m_location{0, 0} {}

  bool operator==(const Token& b) const { return kind() == b.kind() && lexeme() == b.lexeme(); }

  Token(Kind kind, const char *start, std::size_t len, Location location = {}) noexcept
      : m_kind(kind), m_lexeme(start, len), m_location(location)
  {
    value.number = 0;
  }
  Token(Kind kind, const char *start, const char *end, Location location = {}) noexcept
      : m_kind(kind), m_lexeme(start, end - start), m_location(location)
  {
    value.number = 0;
  }

  Kind kind() const noexcept { return m_kind; }
  void setKind(Kind kind) noexcept { m_kind = kind; }

  bool is(Kind kind) const noexcept { return m_kind == kind; }
  bool isOneOf(Kind k1, Kind k2) const noexcept
  {
    return m_kind == k1 || m_kind == k2;
  }

  template <typename... Ts>
  bool isOneOf(Kind k1, Kind k2, Ts... ks) const noexcept
  {
    return is(k1) || isOneOf(k2, ks...);
  }

  // reserved words are still words once we are inside a sentence
  bool isWord() const noexcept
  {
    return isOneOf(Kind::Word, Kind::Ingredients, Kind::Method, Kind::Serves);
  }

  // end of a sentence or of the text
  bool isBreak() const noexcept
  {
    return isOneOf(Kind::LineBreak, Kind::BlankLine, Kind::End);
  }

  std::string_view lexeme() const noexcept { return m_lexeme; }
  const char *begin() const noexcept { return m_lexeme.data(); }
  const char *end() const noexcept { return m_lexeme.data() + m_lexeme.size(); }

  const Location& location() const noexcept { return m_location; }
  int line() const noexcept { return m_location.line; }
  int col() const noexcept { return m_location.col; }
  const char* toString() const;

  union
  {
    i64 number;
  } value;

private:
  Kind m_kind;
  std::string_view m_lexeme;
  Location m_location;
};

std::ostream &operator<<(std::ostream &os, const Token &t);
std::ostream &operator<<(std::ostream &os, const Token::Kind &kind);
std::ostream &operator<<(std::ostream &os, const Token::Location &location);

const char* kindToString(const Token::Kind &k);
