#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace twingraph::query {

struct CompiledQuery {
  // Full Cypher text, LIMIT included.
  std::string text;
  // Same query without the LIMIT clause; paging appends SKIP/LIMIT to it.
  std::string                 body;
  std::optional<std::int64_t> limit;

  // Pattern contains a variable-length edge; replicas cannot run it.
  bool requires_read_write = false;
  bool uses_wildcard       = false;
  // FROM had no alias and one was injected; single-column rows are the entity itself.
  bool default_alias = false;
};

// Throws CompileError carrying the offending fragment.
CompiledQuery Compile(std::string_view query, std::string_view graph_name);

// A twin query is SELECT text that is not already Cypher.
bool IsTwinQuery(std::string_view query);

} // namespace twingraph::query
