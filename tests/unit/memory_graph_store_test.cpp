#include "internal/graph/memory/memory_graph_store.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

using namespace twingraph::graph;
using twingraph::graph::memory::MemoryGraphStore;
using twingraph::util::Json;

namespace {

Json Twin(const std::string& id, const std::string& etag = "W/\"1\"") {
  return Json{{"$dtId", id}, {"$etag", etag}, {"$metadata", {{"$model", "dtmi:example:Room;1"}}}};
}

Json Edge(const std::string& source, const std::string& id, const std::string& target,
          const std::string& name = "contains") {
  return Json{{"$relationshipId", id},
              {"$sourceId", source},
              {"$targetId", target},
              {"$relationshipName", name},
              {"$etag", "W/\"e\""}};
}

Json Model(const std::string& id, const std::vector<std::string>& bases = {}) {
  return Json{{"id", id}, {"bases", bases}};
}

void TestTwinConditionalWrites() {
  MemoryGraphStore store;
  assert(store.UpsertTwin(Json{{"name", "anonymous"}}).code == ErrorCode::InternalError);
  assert(store.UpsertTwin(Twin("a")));

  auto replaced = Twin("a", "W/\"2\"");
  assert(store.ReplaceTwinIfMatch(replaced, "W/\"0\"").code == ErrorCode::Conflict);
  assert(store.ReplaceTwinIfMatch(replaced, "W/\"1\""));
  assert((*store.GetTwin("a"))["$etag"] == "W/\"2\"");
  assert(store.ReplaceTwinIfMatch(Twin("ghost"), "W/\"1\"").code == ErrorCode::NotFound);

  auto found = store.FindExistingTwins({"a", "ghost", "a"});
  assert((found == std::vector<std::string>{"a"}));
}

void TestMutateTwinWritesBelowTheRoot() {
  MemoryGraphStore store;
  assert(store.UpsertTwin(Twin("a")));

  std::vector<PropertyMutation> mutations = {
      {{"thermostat", "setPoint"}, Json(21.5)},
      {{"$metadata", "thermostat", "lastUpdateTime"}, Json("2024-01-01T00:00:00.0000000Z")},
      {{"missing", "key"}, std::nullopt},
      {{"$metadata", "$model"}, std::nullopt},
      {{"$etag"}, Json("W/\"2\"")},
  };
  assert(store.MutateTwin("a", mutations, "W/\"1\""));

  const auto twin = *store.GetTwin("a");
  assert(twin["thermostat"]["setPoint"] == 21.5);
  assert(twin["$metadata"]["thermostat"]["lastUpdateTime"] == "2024-01-01T00:00:00.0000000Z");
  assert(!twin["$metadata"].contains("$model"));
  assert(!twin.contains("missing"));
  assert(twin["$etag"] == "W/\"2\"");

  assert(store.MutateTwin("a", mutations, "W/\"1\"").code == ErrorCode::Conflict);
  assert(store.MutateTwin("ghost", mutations, "W/\"1\"").code == ErrorCode::NotFound);

  // a failed mutation leaves the twin untouched
  std::vector<PropertyMutation> bad = {{{"$etag"}, Json("W/\"3\"")}, {{"$dtId", "nested"}, Json(1)}};
  assert(store.MutateTwin("a", bad, "W/\"2\"").code == ErrorCode::InternalError);
  assert((*store.GetTwin("a"))["$etag"] == "W/\"2\"");
}

void TestRelationshipsNeedBothEndpoints() {
  MemoryGraphStore store;
  assert(store.UpsertTwin(Twin("a")));
  assert(store.UpsertTwin(Twin("b")));

  assert(store.UpsertRelationship(Edge("a", "r1", "ghost")).code == ErrorCode::NotFound);
  assert(store.UpsertRelationship(Edge("a", "r1", "b")));
  assert(store.UpsertRelationship(Edge("a", "r2", "b", "feeds")));

  assert(store.ListRelationships("a", std::nullopt).size() == 2);
  assert(store.ListRelationships("a", std::string("feeds")).size() == 1);
  assert(store.ListIncomingRelationships("b").size() == 2);
  assert(store.ListIncomingRelationships("a").empty());

  assert(store.DeleteTwin("b").code == ErrorCode::ConstraintViolation);
  assert(store.DeleteRelationship("a", "r1"));
  assert(store.DeleteRelationship("a", "r1").code == ErrorCode::NotFound);
  assert(store.DeleteRelationship("a", "r2"));
  assert(store.DeleteTwin("b"));
  assert(store.DeleteTwin("b").code == ErrorCode::NotFound);
}

void TestGroupedRelationshipUpsert() {
  MemoryGraphStore store;
  assert(store.UpsertTwin(Twin("a")));
  assert(store.UpsertTwin(Twin("b")));

  std::vector<std::size_t> unwritten;
  assert(store.UpsertRelationships("contains", {Edge("a", "r1", "b"), Edge("a", "r2", "b", "feeds")}, unwritten)
             .code == ErrorCode::InternalError);
  assert(store.ListRelationships("a", std::nullopt).empty());

  unwritten.clear();
  assert(store.UpsertRelationships("contains", {Edge("a", "r1", "b"), Edge("a", "r2", "gone")}, unwritten));
  assert(store.GetRelationship("a", "r1"));
  assert(!store.GetRelationship("a", "r2"));
  assert((unwritten == std::vector<std::size_t>{1}));

  auto changed    = Edge("a", "r1", "b");
  changed["$etag"] = "W/\"f\"";
  assert(store.ReplaceRelationshipIfMatch(changed, "W/\"x\"").code == ErrorCode::Conflict);
  assert(store.ReplaceRelationshipIfMatch(changed, "W/\"e\""));
  assert(store.ReplaceRelationshipIfMatch(Edge("a", "r9", "b"), "W/\"e\"").code == ErrorCode::NotFound);
}

void TestModelDependencies() {
  MemoryGraphStore store;
  assert(store.DeleteAllModels().code == ErrorCode::NotFound);

  assert(store.InsertModels({Model("space"), Model("room", {"space"})}));
  assert(store.InsertModels({Model("device"), Model("room")}).code == ErrorCode::AlreadyExists);
  assert(!store.GetModel("device"));
  assert(store.InsertModels({Model("x"), Model("x")}).code == ErrorCode::AlreadyExists);

  assert(store.AddModelEdge("room", "space", "_extends"));
  assert(store.AddModelEdge("room", "ghost", "_extends").code == ErrorCode::NotFound);
  assert(store.ModelEdgeCount("_extends") == 1);

  auto dependencies = store.ListModels({"room"});
  assert(dependencies.size() == 2);
  assert(dependencies[0]["id"] == "room");
  assert(dependencies[1]["id"] == "space");
  assert(store.ListModels({}).size() == 2);

  assert(store.DeleteModel("space").code == ErrorCode::ConstraintViolation);
  assert(store.DeleteModel("room"));
  assert(store.ModelEdgeCount("_extends") == 0);
  assert(store.DeleteModel("space"));
  assert(store.DeleteModel("space").code == ErrorCode::NotFound);

  assert(store.EnsureEdgeLabel("contains"));
  assert(store.EnsureEdgeLabel("contains"));
  assert(store.HasEdgeLabel("contains"));
  assert(!store.HasEdgeLabel("feeds"));
}

void TestExecuteIsUnsupported() {
  MemoryGraphStore store;
  bool             threw = false;
  try {
    (void)store.Execute("MATCH (n) RETURN n", SessionRole::kPreferReplica);
  } catch (const twingraph::util::Unsupported&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTwinConditionalWrites();
  TestMutateTwinWritesBelowTheRoot();
  TestRelationshipsNeedBothEndpoints();
  TestGroupedRelationshipUpsert();
  TestModelDependencies();
  TestExecuteIsUnsupported();

  std::cout << "twingraph_unit_memory_graph_store: pass\n";
  return 0;
}
