#include <cassert>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/query/cypher_inspection.hpp"
#include "internal/query/query_service.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace {

using twingraph::graph::GraphValue;
using twingraph::graph::QueryRows;
using twingraph::graph::SessionRole;
using twingraph::graph::ValueKind;
using twingraph::graph::memory::MemoryGraphStore;
using twingraph::query::FindLimit;
using twingraph::query::FindSkip;
using twingraph::query::QueryOptions;
using twingraph::query::QueryService;
using twingraph::util::Base64Encode;
using twingraph::util::Json;

// Replays canned result sets and records what was asked of it.
class ScriptedGraphStore : public MemoryGraphStore {
 public:
  std::deque<QueryRows>    responses;
  std::vector<std::string> statements;
  std::vector<SessionRole> roles;

  QueryRows Execute(const std::string& cypher, SessionRole role) override {
    statements.push_back(cypher);
    roles.push_back(role);
    if (responses.empty()) return {};
    auto rows = std::move(responses.front());
    responses.pop_front();
    return rows;
  }
};

GraphValue Vertex(const std::string& id);

// Serves twin0..twinN-1 and honors the statement's SKIP and LIMIT.
class SlicingGraphStore : public MemoryGraphStore {
 public:
  explicit SlicingGraphStore(std::int64_t count) : count_(count) {
  }

  std::vector<std::string> statements;

  QueryRows Execute(const std::string& cypher, SessionRole) override {
    statements.push_back(cypher);
    const auto skip  = FindSkip(cypher).value_or(0);
    const auto limit = FindLimit(cypher).value_or(count_);

    QueryRows rows;
    rows.columns = {"T"};
    for (auto i = skip; i < count_ && i < skip + limit; ++i) {
      rows.rows.push_back({Vertex("twin" + std::to_string(i))});
    }
    return rows;
  }

 private:
  std::int64_t count_;
};

GraphValue Vertex(const std::string& id) {
  return {ValueKind::Vertex, Json{{"id", 1}, {"label", "Twin"}, {"properties", {{"$dtId", id}}}}};
}

QueryRows Twins(const std::vector<std::string>& ids) {
  QueryRows rows;
  rows.columns = {"T"};
  for (const auto& id : ids) rows.rows.push_back({Vertex(id)});
  return rows;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestSinglePageUnwrapsTwins() {
  auto         store = std::make_shared<ScriptedGraphStore>();
  QueryService service(store, "digitaltwins");
  store->responses.push_back(Twins({"room1", "room2"}));

  auto page = service.Query("SELECT * FROM DIGITALTWINS");
  assert(store->statements.front() == "MATCH (T:Twin) RETURN *");
  assert(store->roles.front() == SessionRole::kPreferReplica);
  assert(page.items.size() == 2);
  assert(page.items[0] == (Json{{"$dtId", "room1"}}));
  assert(page.continuation_token.empty());
}

void TestPagingCarriesTheQueryInTheToken() {
  auto         store = std::make_shared<ScriptedGraphStore>();
  QueryService service(store, "digitaltwins");
  store->responses.push_back(Twins({"a", "b"}));
  store->responses.push_back(Twins({"c"}));

  QueryOptions options;
  options.max_items_per_page = 2;
  auto first                 = service.Query("SELECT * FROM DIGITALTWINS", options);
  assert(store->statements[0] == "MATCH (T:Twin) RETURN * LIMIT 2");
  assert(first.items.size() == 2);
  assert(!first.continuation_token.empty());

  options.continuation_token = first.continuation_token;
  auto second                = service.Query("", options);
  assert(store->statements[1] == "MATCH (T:Twin) RETURN * SKIP 2 LIMIT 2");
  assert(second.items.size() == 1);
  assert(second.items[0] == (Json{{"$dtId", "c"}}));
  assert(second.continuation_token.empty());
}

void TestTopBoundsPaging() {
  auto         store = std::make_shared<SlicingGraphStore>(10);
  QueryService service(store, "digitaltwins");

  QueryOptions options;
  options.max_items_per_page = 2;
  auto first                 = service.Query("SELECT TOP(3) * FROM DIGITALTWINS", options);
  assert(store->statements[0] == "MATCH (T:Twin) RETURN * LIMIT 2");
  assert(first.items.size() == 2);
  assert(!first.continuation_token.empty());

  options.continuation_token = first.continuation_token;
  auto second                = service.Query("", options);
  assert(store->statements[1] == "MATCH (T:Twin) RETURN * SKIP 2 LIMIT 1");
  assert(second.items.size() == 1);
  assert(second.items[0] == (Json{{"$dtId", "twin2"}}));
  assert(second.continuation_token.empty());
}

void TestTopEqualToPagesEndsWithoutToken() {
  auto         store = std::make_shared<SlicingGraphStore>(10);
  QueryService service(store, "digitaltwins");

  QueryOptions options;
  options.max_items_per_page = 2;
  std::size_t total          = 0;
  int         pages          = 0;
  do {
    auto page = service.Query("SELECT TOP(4) * FROM DIGITALTWINS", options);
    total += page.items.size();
    ++pages;
    options.continuation_token = page.continuation_token;
  } while (!options.continuation_token.empty());

  assert(total == 4);
  assert(pages == 2);

  // a token already past the TOP bound yields an empty page without touching the engine
  const auto statements = store->statements.size();
  options.continuation_token =
      Base64Encode(Json{{"_tr", 4}, {"_q", "MATCH (T:Twin) RETURN * LIMIT 4"}, {"_u", true}}.dump());
  auto past = service.Query("", options);
  assert(past.items.empty());
  assert(past.continuation_token.empty());
  assert(store->statements.size() == statements);
}

void TestCypherRowsAreKeyedByColumn() {
  auto         store = std::make_shared<ScriptedGraphStore>();
  QueryService service(store, "digitaltwins");

  QueryRows rows;
  rows.columns = {"name", "b"};
  rows.rows.push_back({GraphValue{ValueKind::Scalar, "lobby"}, Vertex("b1")});
  rows.rows.push_back({GraphValue{ValueKind::Scalar, nullptr}, Vertex("b2")});
  store->responses.push_back(rows);

  auto page = service.Query("MATCH (a:Twin)-[*1..3]->(b:Twin) RETURN a.name AS name, b");
  assert(store->roles.front() == SessionRole::kReadWrite);
  assert(page.items.size() == 2);
  assert(page.items[0] == (Json{{"name", "lobby"}, {"b", {{"$dtId", "b1"}}}}));
  assert(page.items[1] == (Json{{"b", {{"$dtId", "b2"}}}}));
}

void TestRejectsBadRequests() {
  auto         store = std::make_shared<ScriptedGraphStore>();
  QueryService service(store, "digitaltwins");

  assert(Throws<twingraph::util::CompileError>([&] { (void)service.Query("MATCH (n) DETACH DELETE n"); }));
  assert(Throws<twingraph::util::InvalidArgument>([&] { (void)service.Query(""); }));

  QueryOptions zero;
  zero.max_items_per_page = 0;
  assert(Throws<twingraph::util::InvalidArgument>([&] { (void)service.Query("SELECT * FROM DIGITALTWINS", zero); }));

  QueryOptions garbage;
  garbage.continuation_token = "bm90LWpzb24=";
  assert(Throws<twingraph::util::InvalidArgument>([&] { (void)service.Query("", garbage); }));

  garbage.continuation_token = "%%%";
  assert(Throws<twingraph::util::InvalidArgument>([&] { (void)service.Query("", garbage); }));

  assert(store->statements.empty());
}

void TestMemoryStoreCannotRunQueries() {
  QueryService service(std::make_shared<MemoryGraphStore>(), "digitaltwins");
  assert(Throws<twingraph::util::Unsupported>([&] { (void)service.Query("SELECT * FROM DIGITALTWINS"); }));
}

} // namespace

int main() {
  TestSinglePageUnwrapsTwins();
  TestPagingCarriesTheQueryInTheToken();
  TestTopBoundsPaging();
  TestTopEqualToPagesEndsWithoutToken();
  TestCypherRowsAreKeyedByColumn();
  TestRejectsBadRequests();
  TestMemoryStoreCannotRunQueries();

  std::cout << "twingraph_unit_query_service: pass\n";
  return 0;
}
