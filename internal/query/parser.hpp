#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/query/ast.hpp"
#include "internal/query/lexer.hpp"

namespace twingraph::query {

/*
  Parser

  Recursive descent over the twin-query grammar:

    SELECT [TOP(n) | TOP n] <projection>
    FROM {DIGITALTWINS | RELATIONSHIPS} [alias]
    [MATCH <pattern>] [JOIN a RELATED src.rel [edge]]*
    [WHERE <predicate>]

  Anything left unconsumed is a CompileError naming the fragment.
*/
class Parser {
 public:
  explicit Parser(std::string_view text);

  ast::SelectStatement ParseSelect();

 private:
  const Token& Peek(std::size_t ahead = 0) const;
  const Token& Advance();
  bool         AtSymbol(std::string_view symbol, std::size_t ahead = 0) const;
  bool         AtKeyword(std::string_view keyword, std::size_t ahead = 0) const;
  bool         AtAlias() const;
  void         ExpectSymbol(std::string_view symbol);
  void         ExpectKeyword(std::string_view keyword);
  std::string  ExpectIdentifier(std::string_view what);
  [[noreturn]] void Fail(const std::string& reason) const;

  void ParseTop(ast::SelectStatement& stmt);
  void ParseProjection(ast::SelectStatement& stmt);
  void ParseSource(ast::SelectStatement& stmt);

  ast::PathPattern ParsePathPattern();
  ast::NodePattern ParseNodePattern();
  ast::EdgePattern ParseEdgePattern();
  std::string      ParseRawBraces();
  ast::JoinClause  ParseJoin();

  ast::ExprPtr ParseOr();
  ast::ExprPtr ParseAnd();
  ast::ExprPtr ParseNot();
  ast::ExprPtr ParseComparison();
  ast::ExprPtr ParseAdditive();
  ast::ExprPtr ParseMultiplicative();
  ast::ExprPtr ParseUnary();
  ast::ExprPtr ParsePrimary();
  ast::ExprPtr ParsePath();
  ast::ExprPtr ParseCall();

  std::vector<Token> tokens_;
  std::size_t        pos_ = 0;
};

} // namespace twingraph::query
