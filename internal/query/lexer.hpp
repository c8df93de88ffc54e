#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace twingraph::query {

enum class TokenKind {
  Identifier,
  Number,
  String,
  Symbol,
  End
};

/*
  Token

  space_before records whether whitespace preceded the token in the
  source text. The generator uses it to reproduce the caller's spacing
  after all whitespace runs have been collapsed to one.
*/
struct Token {
  TokenKind   kind = TokenKind::End;
  std::string text;
  bool        space_before = false;
  std::size_t offset       = 0;
};

// Splits twin-query text into tokens. Throws CompileError on characters the
// dialect does not use and on unterminated string literals.
std::vector<Token> Tokenize(std::string_view text);

// Case-insensitive keyword comparison against an upper-case keyword.
bool IsKeyword(const Token& token, std::string_view upper_keyword);

bool IsReservedWord(std::string_view word);

// Re-joins tokens using their recorded spacing.
std::string JoinTokens(const std::vector<Token>& tokens, std::size_t begin, std::size_t end);

} // namespace twingraph::query
