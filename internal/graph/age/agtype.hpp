#pragma once

#include <string>
#include <string_view>

#include "internal/graph/graph_store.hpp"

namespace twingraph::graph::age {

/*
  agtype text codec.

  AGE prints agtype as JSON with type annotations appended to
  composite values ({...}::vertex, {...}::edge, [...]::path) and
  numerics (1.5::numeric). Decoding strips the annotations outside
  string literals and records whether the top-level value was a
  vertex or an edge.
*/

// Throws util::Unsupported when the text is not decodable JSON.
GraphValue DecodeAgtype(std::string_view text);

// Single-quoted Cypher string literal.
std::string QuoteLiteral(std::string_view value);

// '<json>'::agtype
std::string AgtypeLiteral(const Json& value);

} // namespace twingraph::graph::age
