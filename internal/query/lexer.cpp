#include "internal/query/lexer.hpp"

#include <array>
#include <cctype>

#include "internal/util/errors.hpp"

namespace twingraph::query {
namespace {

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsIdentPart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

constexpr std::array<std::string_view, 4> kTwoCharSymbols = {"!=", "<>", "<=", ">="};
constexpr std::string_view                kOneCharSymbols = "()[]{},.*=<>-+/%:|";

constexpr std::array<std::string_view, 20> kReservedWords = {
    "SELECT", "TOP", "FROM", "DIGITALTWINS", "RELATIONSHIPS", "MATCH", "JOIN",  "RELATED", "WHERE", "AND",
    "OR",     "NOT", "IN",   "AS",           "IS",            "NULL",  "TRUE",  "FALSE",   "ORDER", "BY"};

std::string Upper(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace

std::vector<Token> Tokenize(std::string_view text) {
  std::vector<Token> tokens;
  bool               pending_space = false;
  std::size_t        i             = 0;

  while (i < text.size()) {
    const char c = text[i];

    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      ++i;
      continue;
    }

    Token token;
    token.space_before = pending_space;
    token.offset       = i;
    pending_space      = false;

    if (IsIdentStart(c)) {
      std::size_t end = i + 1;
      while (end < text.size() && IsIdentPart(text[end])) ++end;
      token.kind = TokenKind::Identifier;
      token.text = std::string(text.substr(i, end - i));
      i          = end;
    } else if (c == '`') {
      std::size_t end = text.find('`', i + 1);
      if (end == std::string_view::npos) {
        throw util::CompileError("Unterminated quoted identifier: " + std::string(text.substr(i)));
      }
      token.kind = TokenKind::Identifier;
      token.text = std::string(text.substr(i, end - i + 1));
      i          = end + 1;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      std::size_t end = i + 1;
      while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
      if (end + 1 < text.size() && text[end] == '.' && std::isdigit(static_cast<unsigned char>(text[end + 1]))) {
        end += 2;
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
      }
      token.kind = TokenKind::Number;
      token.text = std::string(text.substr(i, end - i));
      i          = end;
    } else if (c == '\'' || c == '"') {
      std::size_t end = i + 1;
      while (end < text.size() && text[end] != c) {
        if (text[end] == '\\') ++end;
        ++end;
      }
      if (end >= text.size()) {
        throw util::CompileError("Unterminated string literal: " + std::string(text.substr(i)));
      }
      token.kind = TokenKind::String;
      token.text = std::string(text.substr(i, end - i + 1));
      i          = end + 1;
    } else {
      token.kind = TokenKind::Symbol;
      bool matched = false;
      for (auto symbol : kTwoCharSymbols) {
        if (text.substr(i, 2) == symbol) {
          token.text = std::string(symbol);
          i += 2;
          matched = true;
          break;
        }
      }
      if (!matched) {
        if (kOneCharSymbols.find(c) == std::string_view::npos) {
          throw util::CompileError("Unexpected character '" + std::string(1, c) + "' in: " + std::string(text.substr(i)));
        }
        token.text = std::string(1, c);
        ++i;
      }
    }

    tokens.push_back(std::move(token));
  }

  Token end;
  end.kind   = TokenKind::End;
  end.offset = text.size();
  tokens.push_back(std::move(end));
  return tokens;
}

bool IsKeyword(const Token& token, std::string_view upper_keyword) {
  return token.kind == TokenKind::Identifier && Upper(token.text) == upper_keyword;
}

bool IsReservedWord(std::string_view word) {
  const auto upper = Upper(word);
  for (auto reserved : kReservedWords) {
    if (upper == reserved) return true;
  }
  return false;
}

std::string JoinTokens(const std::vector<Token>& tokens, std::size_t begin, std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end && i < tokens.size(); ++i) {
    if (tokens[i].kind == TokenKind::End) break;
    if (i != begin && tokens[i].space_before) out += ' ';
    out += tokens[i].text;
  }
  return out;
}

} // namespace twingraph::query
