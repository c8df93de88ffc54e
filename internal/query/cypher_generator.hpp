#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/query/ast.hpp"

namespace twingraph::query {

struct GeneratedClauses {
  std::string pattern;
  std::string where;  // empty when the query has no predicate
  std::string projection;
  bool        variable_length = false;
  bool        default_alias   = false;
};

/*
  CypherGenerator

  Lowers a parsed SELECT statement into the pieces of a Cypher
  MATCH / WHERE / RETURN query. Built-in predicate functions are
  mapped onto Cypher operators; IS_OF_MODEL calls the graph-scoped
  is_of_model() SQL function.
*/
class CypherGenerator {
 public:
  explicit CypherGenerator(std::string graph_name);

  GeneratedClauses Generate(const ast::SelectStatement& stmt);

 private:
  std::string EmitPattern(const ast::SelectStatement& stmt, bool& variable_length);
  std::string EmitPathPattern(const ast::PathPattern& path, bool& variable_length);
  std::string EmitProjection(const ast::SelectStatement& stmt);

  std::string Emit(const ast::Expr& expr);
  std::string EmitPath(const ast::Expr& expr);
  std::string EmitList(const std::vector<ast::ExprPtr>& items);
  std::string EmitCall(const ast::Expr& expr);
  std::string EmitIsOfModel(const ast::Expr& expr);
  std::string EmitBinary(const ast::Expr& expr);

  void        Declare(const std::string& alias);
  std::string GeneratedEdgeAlias();

  std::string              graph_name_;
  std::string              default_alias_;
  std::string              source_alias_;
  std::set<std::string>    declared_;
  std::vector<std::string> label_disjunctions_;
  int                      generated_aliases_ = 0;
  // FROM names exactly one collection, so bare properties belong to it
  bool                     single_collection_ = false;
};

} // namespace twingraph::query
