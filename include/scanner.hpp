#pragma once

#include "token.hpp"

class Scanner
{
public:
  Scanner(const char *start) noexcept : m_start(start), m_prevStart(start) {}

  Token next() noexcept;
  Token peekToken() noexcept;
  void goBack();

private:
  Token nextToken() noexcept;
  char peek() const noexcept { return *m_start; }
  char get() noexcept;
  Token charToken(Token::Kind kind) noexcept;
  Token lineBreak(Token::Location location) noexcept;
  Token wordOrReserved(const char *start, const char *end, Token::Location location) const noexcept;

  bool isWhiteSpace(char c) const noexcept;
  const char *m_start;
  const char *m_prevStart;
  Token::Location m_prevLocation = {1, 0};

  int m_line = 1;
  int m_col = 0;
};
