#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/graph_store.hpp"
#include "internal/util/json.hpp"

namespace twingraph::query {

using util::Json;

struct QueryOptions {
  // Unset: a single page with every row.
  std::optional<std::size_t> max_items_per_page;
  // Opaque token from a previous page; empty for the first page.
  std::string continuation_token;
};

struct QueryPage {
  std::vector<Json> items;
  // Empty on the last page.
  std::string continuation_token;
};

/*
  QueryService

  Runs read-only queries, either Cypher or twin-query text (compiled
  first), one page at a time.

  Paging appends SKIP/LIMIT to the query body. The continuation token
  is base64 JSON {"_tr": rows already returned, "_q": query body} (plus
  "_u" when wildcard rows are unwrapped), so a follow-up page never
  recompiles and never depends on server state.
*/
class QueryService {
 public:
  QueryService(std::shared_ptr<graph::GraphStore> store, std::string graph_name);

  QueryPage Query(const std::string& query, const QueryOptions& options = {});

 private:
  std::shared_ptr<graph::GraphStore> store_;
  std::string                        graph_name_;
};

} // namespace twingraph::query
