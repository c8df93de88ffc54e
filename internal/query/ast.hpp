#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace twingraph::query::ast {

/*
  Syntax tree for the twin-query dialect.

  Every node keeps a space_before flag so the generator can reproduce
  the caller's spacing; the generator never re-parses text.
*/

enum class ExprKind {
  Literal,  // number, string, TRUE/FALSE/NULL
  Path,     // root followed by .name / ['name'] segments
  List,     // [a, b]
  Call,     // NAME(args)
  Star,     // * inside COUNT(*)
  Unary,    // NOT x, -x
  Binary,   // a op b, including AND / OR / IN
  IsNull,   // x IS NULL, x IS NOT NULL
  Paren     // (x)
};

struct PathSegment {
  bool        bracket = false;  // ['x'] form, kept verbatim
  std::string text;             // name for dot segments, full bracket text otherwise
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Expr {
  ExprKind    kind         = ExprKind::Literal;
  bool        space_before = false;
  std::string text;  // literal, path root, call name, operator

  bool                     op_space_before = false;  // Binary
  bool                     negated         = false;  // IsNull
  std::vector<PathSegment> segments;                 // Path
  std::vector<ExprPtr>     children;                 // operands, call arguments, list items
};

struct ProjectionItem {
  ExprPtr     expr;
  std::string alias;  // AS name
};

struct NodePattern {
  bool        space_before = false;
  std::string variable;
  std::string labels;      // raw ":A:B" text, empty when unlabeled
  std::string properties;  // raw "{...}" text
};

struct EdgePattern {
  bool                     bracketed = false;
  bool                     incoming  = false;  // <-[..]-
  bool                     outgoing  = false;  // -[..]->
  std::string              variable;
  std::vector<std::string> labels;
  std::string              length;  // raw "*", "*2", "*1..3"
  std::string              properties;
};

// One comma-separated path: node (edge node)*
struct PathPattern {
  bool                     space_before = false;
  std::vector<NodePattern> nodes;
  std::vector<EdgePattern> edges;
};

struct JoinClause {
  std::string target_alias;
  std::string source_alias;
  std::string relationship_name;
  std::string edge_alias;
};

enum class SourceKind {
  DigitalTwins,
  Relationships
};

struct SelectStatement {
  std::optional<std::int64_t> top;

  bool                        wildcard    = false;
  bool                        count_rows  = false;
  std::vector<ProjectionItem> projection;

  SourceKind               source = SourceKind::DigitalTwins;
  std::string              alias;
  std::vector<PathPattern> match;  // FROM DIGITALTWINS MATCH ...
  std::vector<JoinClause>  joins;

  ExprPtr where;
};

} // namespace twingraph::query::ast
