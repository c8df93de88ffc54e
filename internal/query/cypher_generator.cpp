#include "internal/query/cypher_generator.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace twingraph::query {

using ast::Expr;
using ast::ExprKind;

namespace {

constexpr const char* kTwinLabel = "Twin";

std::string Upper(const std::string& text) {
  std::string out = text;
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

// alias.$name is not valid Cypher; $-prefixed keys are read with bracket access.
std::string DotSegment(const std::string& name) {
  if (!name.empty() && name.front() == '$') {
    return "['" + name + "']";
  }
  return "." + name;
}

std::string Spaced(const Expr& expr, const std::string& text) {
  return expr.space_before ? " " + text : text;
}

bool IsBareIdentifier(const Expr& expr) {
  return expr.kind == ExprKind::Path && expr.segments.empty();
}

} // namespace

CypherGenerator::CypherGenerator(std::string graph_name) : graph_name_(std::move(graph_name)) {
}

GeneratedClauses CypherGenerator::Generate(const ast::SelectStatement& stmt) {
  declared_.clear();
  label_disjunctions_.clear();
  generated_aliases_ = 0;
  default_alias_.clear();
  source_alias_      = stmt.alias;
  single_collection_ = stmt.match.empty() && stmt.joins.empty();

  if (stmt.alias.empty() && single_collection_) {
    default_alias_ = stmt.source == ast::SourceKind::Relationships ? "R" : "T";
  }

  Declare(stmt.alias);
  Declare(default_alias_);

  GeneratedClauses out;
  out.default_alias = !default_alias_.empty();
  out.pattern       = EmitPattern(stmt, out.variable_length);
  out.projection    = EmitProjection(stmt);

  std::string predicate;
  if (stmt.where) {
    predicate = Emit(*stmt.where);
    if (!label_disjunctions_.empty() && stmt.where->kind == ExprKind::Binary && Upper(stmt.where->text) == "OR") {
      predicate = "(" + predicate + ")";
    }
  }

  for (const auto& disjunction : label_disjunctions_) {
    if (!predicate.empty()) predicate += " AND ";
    predicate += disjunction;
  }
  out.where = std::move(predicate);

  return out;
}

void CypherGenerator::Declare(const std::string& alias) {
  if (!alias.empty()) declared_.insert(alias);
}

std::string CypherGenerator::GeneratedEdgeAlias() {
  return "_e" + std::to_string(generated_aliases_++);
}

// ------------------------------------------------------------
// Patterns
// ------------------------------------------------------------

std::string CypherGenerator::EmitPattern(const ast::SelectStatement& stmt, bool& variable_length) {
  if (stmt.source == ast::SourceKind::Relationships) {
    const auto& alias = stmt.alias.empty() ? default_alias_ : stmt.alias;
    return "(:" + std::string(kTwinLabel) + ")-[" + alias + "]->(:" + kTwinLabel + ")";
  }

  if (!stmt.match.empty()) {
    // declare every variable first so predicates can reference any of them
    for (const auto& path : stmt.match) {
      for (const auto& node : path.nodes) Declare(node.variable);
      for (const auto& edge : path.edges) Declare(edge.variable);
    }

    std::string pattern;
    for (std::size_t i = 0; i < stmt.match.size(); ++i) {
      if (i > 0) pattern += stmt.match[i].space_before ? ", " : ",";
      pattern += EmitPathPattern(stmt.match[i], variable_length);
    }
    return pattern;
  }

  if (!stmt.joins.empty()) {
    std::string pattern;
    for (const auto& join : stmt.joins) {
      Declare(join.source_alias);
      Declare(join.target_alias);
      Declare(join.edge_alias);

      if (!pattern.empty()) pattern += ",";
      pattern += "(" + join.source_alias + ":" + kTwinLabel + ")-[" + join.edge_alias + ":" + join.relationship_name +
                 "]->(" + join.target_alias + ":" + kTwinLabel + ")";
    }
    return pattern;
  }

  const auto& alias = stmt.alias.empty() ? default_alias_ : stmt.alias;
  return "(" + alias + ":" + kTwinLabel + ")";
}

std::string CypherGenerator::EmitPathPattern(const ast::PathPattern& path, bool& variable_length) {
  std::string out;

  for (std::size_t i = 0; i < path.nodes.size(); ++i) {
    const auto& node = path.nodes[i];
    out += "(" + node.variable + (node.labels.empty() ? ":" + std::string(kTwinLabel) : node.labels);
    if (!node.properties.empty()) out += " " + node.properties;
    out += ")";

    if (i >= path.edges.size()) continue;

    const auto& edge = path.edges[i];
    out += edge.incoming ? "<-" : "-";

    if (edge.bracketed) {
      std::string variable = edge.variable;
      std::string label;

      if (!edge.length.empty()) variable_length = true;

      if (edge.labels.size() > 1) {
        if (!edge.length.empty()) {
          throw util::CompileError("Multi-label edges cannot have a variable length: [" + edge.variable + ":" +
                                   edge.labels.front() + "|..." + edge.length + "]");
        }
        if (variable.empty()) variable = GeneratedEdgeAlias();

        std::string disjunction = "(";
        for (std::size_t l = 0; l < edge.labels.size(); ++l) {
          if (l > 0) disjunction += " OR ";
          disjunction += "label(" + variable + ") = '" + edge.labels[l] + "'";
        }
        disjunction += ")";
        label_disjunctions_.push_back(std::move(disjunction));
      } else if (edge.labels.size() == 1) {
        label = ":" + edge.labels.front();
      }

      out += "[" + variable + label + edge.length;
      if (!edge.properties.empty()) out += " " + edge.properties;
      out += "]";
    }

    out += edge.outgoing ? "->" : "-";
  }

  return out;
}

std::string CypherGenerator::EmitProjection(const ast::SelectStatement& stmt) {
  if (stmt.wildcard) return "*";
  if (stmt.count_rows) return "COUNT(*)";

  std::string out;
  for (std::size_t i = 0; i < stmt.projection.size(); ++i) {
    const auto& item = stmt.projection[i];
    if (i > 0) out += item.expr->space_before ? ", " : ",";
    out += Emit(*item.expr);
    if (!item.alias.empty()) out += " AS " + item.alias;
  }
  return out;
}

// ------------------------------------------------------------
// Expressions
// ------------------------------------------------------------

std::string CypherGenerator::Emit(const Expr& expr) {
  switch (expr.kind) {
    case ExprKind::Literal:
      return expr.text;

    case ExprKind::Star:
      return "*";

    case ExprKind::Path:
      return EmitPath(expr);

    case ExprKind::List:
      return "[" + EmitList(expr.children) + "]";

    case ExprKind::Call:
      return EmitCall(expr);

    case ExprKind::Unary:
      if (expr.text == "NOT") return "NOT " + Emit(*expr.children.front());
      return expr.text + Emit(*expr.children.front());

    case ExprKind::Binary:
      return EmitBinary(expr);

    case ExprKind::IsNull:
      return Emit(*expr.children.front()) + (expr.negated ? " IS NOT NULL" : " IS NULL");

    case ExprKind::Paren: {
      const auto& inner = *expr.children.front();
      return "(" + Spaced(inner, Emit(inner)) + ")";
    }
  }
  throw util::CompileError("Unsupported expression: " + expr.text);
}

std::string CypherGenerator::EmitPath(const Expr& expr) {
  std::string out;

  if (declared_.count(expr.text) > 0) {
    out = expr.text;
  } else if (!default_alias_.empty()) {
    out = default_alias_ + DotSegment(expr.text);
  } else if (single_collection_ && !source_alias_.empty()) {
    out = source_alias_ + DotSegment(expr.text);
  } else {
    throw util::CompileError("'" + expr.text + "' is not a declared alias; qualify the property with one");
  }

  for (const auto& segment : expr.segments) {
    out += segment.bracket ? segment.text : DotSegment(segment.text);
  }
  return out;
}

std::string CypherGenerator::EmitList(const std::vector<ast::ExprPtr>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ",";
    out += Spaced(*items[i], Emit(*items[i]));
  }
  return out;
}

std::string CypherGenerator::EmitCall(const Expr& expr) {
  const auto name = Upper(expr.text);

  if (name == "IS_OF_MODEL") {
    return EmitIsOfModel(expr);
  }

  if (name == "STARTSWITH" || name == "ENDSWITH" || name == "CONTAINS") {
    if (expr.children.size() != 2) {
      throw util::CompileError(name + " expects two arguments");
    }
    const char* op = name == "STARTSWITH" ? " STARTS WITH " : name == "ENDSWITH" ? " ENDS WITH " : " CONTAINS ";
    return Emit(*expr.children[0]) + op + Emit(*expr.children[1]);
  }

  if (name == "IS_NULL" || name == "IS_DEFINED" || name == "IS_NUMBER") {
    if (expr.children.size() != 1) {
      throw util::CompileError(name + " expects one argument");
    }
    const auto operand = Emit(*expr.children.front());
    if (name == "IS_NULL") return operand + " IS NULL";
    if (name == "IS_DEFINED") return operand + " IS NOT NULL";
    return "(toFloat(" + operand + ") IS NOT NULL AND NOT (toString(" + operand + ") = " + operand + "))";
  }

  return expr.text + "(" + EmitList(expr.children) + ")";
}

// IS_OF_MODEL([alias,] 'model'[, exact])
std::string CypherGenerator::EmitIsOfModel(const Expr& expr) {
  const auto& args = expr.children;
  std::size_t next = 0;
  std::string alias;

  if (!args.empty() && IsBareIdentifier(*args.front()) && Upper(args.front()->text) != "EXACT") {
    alias = args.front()->text;
    next  = 1;
  } else if (!default_alias_.empty()) {
    alias = default_alias_;
  } else if (!source_alias_.empty()) {
    alias = source_alias_;
  } else {
    throw util::CompileError("IS_OF_MODEL needs an alias when the query has no single collection alias");
  }

  if (next >= args.size() || args[next]->kind != ExprKind::Literal || args[next]->text.empty() ||
      (args[next]->text.front() != '\'' && args[next]->text.front() != '"')) {
    throw util::CompileError("IS_OF_MODEL expects a model id string literal");
  }
  const auto& model = args[next]->text;
  ++next;

  bool exact = false;
  if (next < args.size()) {
    const auto flag = Upper(args[next]->text);
    if (flag == "EXACT" || flag == "TRUE") {
      exact = true;
    } else if (flag != "FALSE") {
      throw util::CompileError("IS_OF_MODEL: unexpected argument '" + args[next]->text + "'");
    }
    ++next;
  }

  if (next != args.size()) {
    throw util::CompileError("IS_OF_MODEL: too many arguments");
  }

  return graph_name_ + ".is_of_model(" + alias + "," + model + (exact ? ",true" : "") + ")";
}

std::string CypherGenerator::EmitBinary(const Expr& expr) {
  const auto& lhs = *expr.children[0];
  const auto& rhs = *expr.children[1];
  const auto  op  = Upper(expr.text);

  if (op == "!=" || op == "<>") {
    return "NOT (" + Emit(lhs) + " = " + Emit(rhs) + ")";
  }

  if (op == "AND" || op == "OR" || op == "IN") {
    return Emit(lhs) + " " + op + " " + Emit(rhs);
  }

  return Emit(lhs) + (expr.op_space_before ? " " : "") + expr.text + Spaced(rhs, Emit(rhs));
}

} // namespace twingraph::query
