#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace twingraph::query {

/*
  Lightweight checks over Cypher text that did not come from the
  compiler (callers may submit Cypher directly).
*/

// [r*], [:rel*1..3] and friends.
bool HasVariableLengthEdge(std::string_view cypher);

// First write keyword found (CREATE, DELETE, DETACH, SET, MERGE, REMOVE), if any.
std::optional<std::string> FindForbiddenKeyword(std::string_view cypher);

// Column names produced by the final RETURN clause. RETURN * expands to the
// named variables of the MATCH patterns in order of appearance.
std::vector<std::string> ReturnColumns(std::string_view cypher);

std::optional<std::int64_t> FindLimit(std::string_view cypher);
std::optional<std::int64_t> FindSkip(std::string_view cypher);

// Removes a trailing "LIMIT n" clause.
std::string StripLimit(std::string_view cypher);

} // namespace twingraph::query
