#include "internal/query/parser.hpp"

#include <cctype>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace twingraph::query {

using ast::Expr;
using ast::ExprKind;
using ast::ExprPtr;

namespace {

ExprPtr MakeExpr(ExprKind kind, const Token& first) {
  auto expr          = std::make_unique<Expr>();
  expr->kind         = kind;
  expr->space_before = first.space_before;
  return expr;
}

ExprPtr MakeBinary(ExprPtr lhs, const Token& op, ExprPtr rhs) {
  auto expr             = std::make_unique<Expr>();
  expr->kind            = ExprKind::Binary;
  expr->space_before    = lhs->space_before;
  expr->text            = op.text;
  expr->op_space_before = op.space_before;
  expr->children.push_back(std::move(lhs));
  expr->children.push_back(std::move(rhs));
  return expr;
}

bool IsComparisonSymbol(const Token& token) {
  if (token.kind != TokenKind::Symbol) return false;
  return token.text == "=" || token.text == "!=" || token.text == "<>" || token.text == "<" || token.text == ">" ||
         token.text == "<=" || token.text == ">=";
}

} // namespace

Parser::Parser(std::string_view text) : tokens_(Tokenize(text)) {
}

// ------------------------------------------------------------
// Token helpers
// ------------------------------------------------------------

const Token& Parser::Peek(std::size_t ahead) const {
  const auto index = pos_ + ahead;
  return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::Advance() {
  const Token& token = Peek();
  if (token.kind != TokenKind::End) ++pos_;
  return token;
}

bool Parser::AtSymbol(std::string_view symbol, std::size_t ahead) const {
  const auto& token = Peek(ahead);
  return token.kind == TokenKind::Symbol && token.text == symbol;
}

bool Parser::AtKeyword(std::string_view keyword, std::size_t ahead) const {
  return IsKeyword(Peek(ahead), keyword);
}

bool Parser::AtAlias() const {
  const auto& token = Peek();
  return token.kind == TokenKind::Identifier && !IsReservedWord(token.text);
}

void Parser::ExpectSymbol(std::string_view symbol) {
  if (!AtSymbol(symbol)) Fail("expected '" + std::string(symbol) + "'");
  Advance();
}

void Parser::ExpectKeyword(std::string_view keyword) {
  if (!AtKeyword(keyword)) Fail("expected " + std::string(keyword));
  Advance();
}

std::string Parser::ExpectIdentifier(std::string_view what) {
  if (!AtAlias()) Fail("expected " + std::string(what));
  return Advance().text;
}

void Parser::Fail(const std::string& reason) const {
  const auto& token = Peek();
  if (token.kind == TokenKind::End) {
    throw util::CompileError("Invalid query: " + reason + " at end of query");
  }
  throw util::CompileError("Invalid query: " + reason + " near '" + JoinTokens(tokens_, pos_, tokens_.size()) + "'");
}

// ------------------------------------------------------------
// Statement
// ------------------------------------------------------------

ast::SelectStatement Parser::ParseSelect() {
  ast::SelectStatement stmt;

  ExpectKeyword("SELECT");
  ParseTop(stmt);
  ParseProjection(stmt);
  ExpectKeyword("FROM");
  ParseSource(stmt);

  if (AtKeyword("WHERE")) {
    Advance();
    stmt.where = ParseOr();
  }

  if (Peek().kind != TokenKind::End) {
    Fail("unsupported clause");
  }

  return stmt;
}

void Parser::ParseTop(ast::SelectStatement& stmt) {
  if (!AtKeyword("TOP")) return;
  Advance();

  const bool parenthesized = AtSymbol("(");
  if (parenthesized) Advance();

  if (Peek().kind != TokenKind::Number) Fail("expected row count after TOP");
  stmt.top = std::strtoll(Advance().text.c_str(), nullptr, 10);

  if (parenthesized) ExpectSymbol(")");
}

void Parser::ParseProjection(ast::SelectStatement& stmt) {
  if (AtKeyword("FROM")) {
    stmt.wildcard = true;
    return;
  }

  if (AtSymbol("*") && AtKeyword("FROM", 1)) {
    Advance();
    stmt.wildcard = true;
    return;
  }

  for (;;) {
    ast::ProjectionItem item;
    item.expr = ParseOr();
    if (AtKeyword("AS")) {
      Advance();
      item.alias = ExpectIdentifier("projection alias");
    }
    stmt.projection.push_back(std::move(item));

    if (!AtSymbol(",")) break;
    Advance();
  }

  if (stmt.projection.size() == 1 && stmt.projection.front().alias.empty()) {
    const auto& expr = *stmt.projection.front().expr;
    if (expr.kind == ExprKind::Call) {
      std::string upper;
      for (char c : expr.text) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      const bool no_args   = expr.children.empty();
      const bool star_args = expr.children.size() == 1 && expr.children.front()->kind == ExprKind::Star;
      if (upper == "COUNT" && (no_args || star_args)) {
        stmt.count_rows = true;
        stmt.projection.clear();
      }
    }
  }
}

void Parser::ParseSource(ast::SelectStatement& stmt) {
  if (AtKeyword("RELATIONSHIPS")) {
    Advance();
    stmt.source = ast::SourceKind::Relationships;
    if (AtAlias()) stmt.alias = Advance().text;
    return;
  }

  if (!AtKeyword("DIGITALTWINS")) Fail("unsupported source collection");
  Advance();
  stmt.source = ast::SourceKind::DigitalTwins;

  if (AtAlias()) stmt.alias = Advance().text;

  if (AtKeyword("MATCH")) {
    if (!stmt.alias.empty()) Fail("MATCH cannot follow a collection alias");
    Advance();
    stmt.match.push_back(ParsePathPattern());
    while (AtSymbol(",")) {
      Advance();
      stmt.match.push_back(ParsePathPattern());
    }
    return;
  }

  while (AtKeyword("JOIN")) {
    stmt.joins.push_back(ParseJoin());
  }
}

// ------------------------------------------------------------
// MATCH patterns
// ------------------------------------------------------------

ast::PathPattern Parser::ParsePathPattern() {
  ast::PathPattern path;
  path.space_before = Peek().space_before;
  path.nodes.push_back(ParseNodePattern());

  while (AtSymbol("-") || AtSymbol("<")) {
    path.edges.push_back(ParseEdgePattern());
    path.nodes.push_back(ParseNodePattern());
  }
  return path;
}

ast::NodePattern Parser::ParseNodePattern() {
  ast::NodePattern node;
  node.space_before = Peek().space_before;

  ExpectSymbol("(");
  if (AtAlias()) node.variable = Advance().text;
  while (AtSymbol(":")) {
    Advance();
    node.labels += ":" + ExpectIdentifier("node label");
  }
  if (AtSymbol("{")) node.properties = ParseRawBraces();
  ExpectSymbol(")");
  return node;
}

ast::EdgePattern Parser::ParseEdgePattern() {
  ast::EdgePattern edge;

  if (AtSymbol("<")) {
    Advance();
    edge.incoming = true;
  }
  ExpectSymbol("-");

  if (AtSymbol("[")) {
    Advance();
    edge.bracketed = true;

    if (AtAlias()) edge.variable = Advance().text;
    if (AtSymbol(":")) {
      Advance();
      edge.labels.push_back(ExpectIdentifier("relationship name"));
      while (AtSymbol("|")) {
        Advance();
        if (AtSymbol(":")) Advance();
        edge.labels.push_back(ExpectIdentifier("relationship name"));
      }
    }
    if (AtSymbol("*")) {
      edge.length = Advance().text;
      while (Peek().kind == TokenKind::Number || AtSymbol(".")) {
        edge.length += Advance().text;
      }
    }
    if (AtSymbol("{")) edge.properties = ParseRawBraces();
    ExpectSymbol("]");
  }

  ExpectSymbol("-");
  if (AtSymbol(">")) {
    Advance();
    edge.outgoing = true;
  }
  if (edge.incoming && edge.outgoing) Fail("edge cannot point both ways");
  return edge;
}

std::string Parser::ParseRawBraces() {
  const auto begin = pos_;
  int        depth = 0;
  do {
    if (Peek().kind == TokenKind::End) Fail("unterminated property map");
    if (AtSymbol("{")) ++depth;
    if (AtSymbol("}")) --depth;
    Advance();
  } while (depth > 0);
  return JoinTokens(tokens_, begin, pos_);
}

ast::JoinClause Parser::ParseJoin() {
  ast::JoinClause join;
  ExpectKeyword("JOIN");
  join.target_alias = ExpectIdentifier("join alias");
  ExpectKeyword("RELATED");
  join.source_alias = ExpectIdentifier("related alias");
  ExpectSymbol(".");
  join.relationship_name = ExpectIdentifier("relationship name");
  if (AtAlias()) join.edge_alias = Advance().text;
  return join;
}

// ------------------------------------------------------------
// Expressions
// ------------------------------------------------------------

ExprPtr Parser::ParseOr() {
  auto lhs = ParseAnd();
  while (AtKeyword("OR")) {
    const Token& op = Advance();
    lhs             = MakeBinary(std::move(lhs), op, ParseAnd());
  }
  return lhs;
}

ExprPtr Parser::ParseAnd() {
  auto lhs = ParseNot();
  while (AtKeyword("AND")) {
    const Token& op = Advance();
    lhs             = MakeBinary(std::move(lhs), op, ParseNot());
  }
  return lhs;
}

ExprPtr Parser::ParseNot() {
  if (AtKeyword("NOT")) {
    auto expr  = MakeExpr(ExprKind::Unary, Peek());
    expr->text = "NOT";
    Advance();
    expr->children.push_back(ParseNot());
    return expr;
  }
  return ParseComparison();
}

ExprPtr Parser::ParseComparison() {
  auto lhs = ParseAdditive();

  if (IsComparisonSymbol(Peek())) {
    const Token& op = Advance();
    return MakeBinary(std::move(lhs), op, ParseAdditive());
  }

  if (AtKeyword("IN")) {
    const Token& op = Advance();
    return MakeBinary(std::move(lhs), op, ParseAdditive());
  }

  if (AtKeyword("IS")) {
    Advance();
    auto expr          = std::make_unique<Expr>();
    expr->kind         = ExprKind::IsNull;
    expr->space_before = lhs->space_before;
    if (AtKeyword("NOT")) {
      Advance();
      expr->negated = true;
    }
    ExpectKeyword("NULL");
    expr->children.push_back(std::move(lhs));
    return expr;
  }

  return lhs;
}

ExprPtr Parser::ParseAdditive() {
  auto lhs = ParseMultiplicative();
  while (AtSymbol("+") || AtSymbol("-")) {
    const Token& op = Advance();
    lhs             = MakeBinary(std::move(lhs), op, ParseMultiplicative());
  }
  return lhs;
}

ExprPtr Parser::ParseMultiplicative() {
  auto lhs = ParseUnary();
  while (AtSymbol("*") || AtSymbol("/") || AtSymbol("%")) {
    const Token& op = Advance();
    lhs             = MakeBinary(std::move(lhs), op, ParseUnary());
  }
  return lhs;
}

ExprPtr Parser::ParseUnary() {
  if (AtSymbol("-")) {
    auto expr  = MakeExpr(ExprKind::Unary, Peek());
    expr->text = "-";
    Advance();
    expr->children.push_back(ParseUnary());
    return expr;
  }
  return ParsePrimary();
}

ExprPtr Parser::ParsePrimary() {
  const Token& token = Peek();

  if (token.kind == TokenKind::Number || token.kind == TokenKind::String) {
    auto expr  = MakeExpr(ExprKind::Literal, token);
    expr->text = Advance().text;
    return expr;
  }

  if (AtKeyword("TRUE") || AtKeyword("FALSE") || AtKeyword("NULL")) {
    auto expr  = MakeExpr(ExprKind::Literal, token);
    expr->text = Advance().text;
    return expr;
  }

  if (AtSymbol("[")) {
    auto expr = MakeExpr(ExprKind::List, token);
    Advance();
    if (!AtSymbol("]")) {
      expr->children.push_back(ParseOr());
      while (AtSymbol(",")) {
        Advance();
        expr->children.push_back(ParseOr());
      }
    }
    ExpectSymbol("]");
    return expr;
  }

  if (AtSymbol("(")) {
    auto expr = MakeExpr(ExprKind::Paren, token);
    Advance();
    expr->children.push_back(ParseOr());
    ExpectSymbol(")");
    return expr;
  }

  if (token.kind == TokenKind::Identifier && !IsReservedWord(token.text)) {
    return AtSymbol("(", 1) ? ParseCall() : ParsePath();
  }

  Fail("expected expression");
}

ExprPtr Parser::ParseCall() {
  auto expr  = MakeExpr(ExprKind::Call, Peek());
  expr->text = Advance().text;
  ExpectSymbol("(");

  if (AtSymbol("*")) {
    auto star = MakeExpr(ExprKind::Star, Peek());
    Advance();
    expr->children.push_back(std::move(star));
  } else if (!AtSymbol(")")) {
    expr->children.push_back(ParseOr());
    while (AtSymbol(",")) {
      Advance();
      expr->children.push_back(ParseOr());
    }
  }

  ExpectSymbol(")");
  return expr;
}

ExprPtr Parser::ParsePath() {
  auto expr  = MakeExpr(ExprKind::Path, Peek());
  expr->text = Advance().text;

  for (;;) {
    if (AtSymbol(".") && Peek(1).kind == TokenKind::Identifier) {
      Advance();
      expr->segments.push_back({false, Advance().text});
      continue;
    }
    if (AtSymbol("[") && (Peek(1).kind == TokenKind::String || Peek(1).kind == TokenKind::Number) &&
        AtSymbol("]", 2)) {
      Advance();
      std::string text = "[" + Advance().text + "]";
      Advance();
      expr->segments.push_back({true, std::move(text)});
      continue;
    }
    break;
  }
  return expr;
}

} // namespace twingraph::query
