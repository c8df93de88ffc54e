#include <cassert>
#include <cstddef>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dtdl/model_parser.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/twins/digital_twin_service.hpp"
#include "internal/twins/relationship_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/etag.hpp"

namespace {

using twingraph::dtdl::DtdlModelParser;
using twingraph::graph::ErrorCode;
using twingraph::graph::Result;
using twingraph::graph::memory::MemoryGraphStore;
using twingraph::models::ModelRegistry;
using twingraph::twins::DigitalTwinService;
using twingraph::twins::EntityLimits;
using twingraph::twins::RelationshipService;
using twingraph::util::Json;
using twingraph::util::TimePoint;

const char* kSpace = R"({
  "@id": "dtmi:example:Space;1",
  "@type": "Interface",
  "contents": [ { "@type": "Property", "name": "name", "schema": "string" } ]
})";

const char* kRoom = R"({
  "@id": "dtmi:example:Room;1",
  "@type": "Interface",
  "extends": "dtmi:example:Space;1",
  "contents": [
    { "@type": "Relationship", "name": "contains", "target": "dtmi:example:Space;1",
      "properties": [ { "name": "since", "schema": "dateTime" } ] },
    { "@type": "Relationship", "name": "feeds" }
  ]
})";

const char* kDevice = R"({
  "@id": "dtmi:example:Device;1",
  "@type": "Interface",
  "contents": [ { "@type": "Property", "name": "serial", "schema": "string" } ]
})";

// Fails every grouped write for one relationship name, or deletes a twin just before the write.
class FlakyGraphStore : public MemoryGraphStore {
 public:
  std::string failing_name;
  std::string vanishing_twin;

  Result UpsertRelationships(const std::string& relationship_name, const std::vector<Json>& relationships,
                             std::vector<std::size_t>& unwritten) override {
    if (relationship_name == failing_name) {
      throw std::runtime_error("connection reset");
    }
    if (!vanishing_twin.empty()) {
      const auto deleted = MemoryGraphStore::DeleteTwin(vanishing_twin);
      assert(deleted);
      vanishing_twin.clear();
    }
    return MemoryGraphStore::UpsertRelationships(relationship_name, relationships, unwritten);
  }
};

struct Fixture {
  TimePoint                            now{std::chrono::seconds(1704067200)};
  std::shared_ptr<FlakyGraphStore>     store = std::make_shared<FlakyGraphStore>();
  std::shared_ptr<ModelRegistry>       registry;
  std::unique_ptr<DigitalTwinService>  twins;
  std::unique_ptr<RelationshipService> relationships;

  explicit Fixture(EntityLimits limits = {}) {
    auto clock    = [this] { return now; };
    registry      = std::make_shared<ModelRegistry>(store, std::make_shared<DtdlModelParser>(),
                                               std::chrono::seconds(10), clock);
    twins         = std::make_unique<DigitalTwinService>(store, registry, limits, clock);
    relationships = std::make_unique<RelationshipService>(store, registry, limits, clock);

    (void)registry->CreateModels({kSpace, kRoom, kDevice});
    (void)twins->CreateOrReplace("room1", Json{{"$metadata", {{"$model", "dtmi:example:Room;1"}}}});
    (void)twins->CreateOrReplace("room2", Json{{"$metadata", {{"$model", "dtmi:example:Room;1"}}}});
    (void)twins->CreateOrReplace("device1", Json{{"$metadata", {{"$model", "dtmi:example:Device;1"}}}});
  }
};

Json Relationship(const std::string& name, const std::string& target) {
  return Json{{"$relationshipName", name}, {"$targetId", target}};
}

Json BatchItem(const std::string& source, const std::string& id, const std::string& name, const std::string& target) {
  return Json{{"$sourceId", source}, {"$relationshipId", id}, {"$relationshipName", name}, {"$targetId", target}};
}

template <typename E, typename Fn>
E Expect(Fn&& fn) {
  try {
    fn();
  } catch (const E& e) {
    return e;
  }
  assert(false && "expected exception was not thrown");
  throw std::logic_error("unreachable");
}

void TestCreateAndRead() {
  Fixture f;
  auto    body = Relationship("contains", "room2");
  body["since"] = "2024-01-01T00:00:00Z";

  auto stored = f.relationships->CreateOrReplace("room1", "r1", body);
  assert(stored["$sourceId"] == "room1");
  assert(stored["$relationshipId"] == "r1");
  assert(stored["$etag"] == twingraph::util::GenerateEtag("room1-r1", f.now));

  assert(f.relationships->Get("room1", "r1") == stored);

  (void)f.relationships->CreateOrReplace("room1", "r2", Relationship("feeds", "device1"));
  assert(f.relationships->List("room1").size() == 2);
  assert(f.relationships->List("room1", std::string("feeds")).size() == 1);
  assert(f.relationships->List("room2").empty());
  assert(f.relationships->ListIncoming("room2").size() == 1);

  auto missing = Expect<twingraph::util::RelationshipNotFound>([&] { (void)f.relationships->Get("room1", "nope"); });
  assert(std::string(missing.what()) == "Relationship with ID nope on room1 not found");
}

void TestCreateRejectsMalformedPayloads() {
  Fixture f;

  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Json::array()); });
  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Json{{"$targetId", "room2"}}); });
  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Json{{"$relationshipName", "contains"}}); });

  auto wrong_source         = Relationship("contains", "room2");
  wrong_source["$sourceId"] = "room2";
  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", wrong_source); });

  auto wrong_id               = Relationship("contains", "room2");
  wrong_id["$relationshipId"] = "r9";
  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", wrong_id); });
}

void TestCreateValidatesAgainstTheModel() {
  Fixture f;

  auto endpoints = Expect<twingraph::util::ValidationFailed>(
      [&] { (void)f.relationships->CreateOrReplace("ghost", "r1", Relationship("contains", "phantom")); });
  assert(endpoints.violations().size() == 2);
  assert(endpoints.violations()[0] == "Source twin 'ghost' does not exist");
  assert(endpoints.violations()[1] == "Target twin 'phantom' does not exist");

  auto undeclared = Expect<twingraph::util::ValidationFailed>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Relationship("owns", "room2")); });
  assert(std::string(undeclared.what()) == "Relationship 'owns' is not defined in the model 'dtmi:example:Room;1'");

  // Device is not a Space
  (void)Expect<twingraph::util::ValidationFailed>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Relationship("contains", "device1")); });

  // relationships declared on Room are unknown to Device twins
  (void)Expect<twingraph::util::ValidationFailed>(
      [&] { (void)f.relationships->CreateOrReplace("device1", "r1", Relationship("feeds", "room1")); });

  auto body     = Relationship("contains", "room2");
  body["since"] = "yesterday";
  body["note"]  = "x";
  auto properties =
      Expect<twingraph::util::ValidationFailed>([&] { (void)f.relationships->CreateOrReplace("room1", "r1", body); });
  assert(properties.violations().size() == 2);
  assert(properties.violations()[0] == "Relationship property 'since': \"yesterday\" is not a valid dateTime value");
  assert(properties.violations()[1] == "Property 'note' is not defined in relationship 'contains'");

  assert(f.relationships->List("room1").empty());
}

void TestIfNoneMatch() {
  Fixture f;
  (void)f.relationships->CreateOrReplace("room1", "r1", Relationship("contains", "room2"), "*");
  (void)Expect<twingraph::util::PreconditionFailed>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r1", Relationship("contains", "room2"), "*"); });
  (void)Expect<twingraph::util::InvalidArgument>(
      [&] { (void)f.relationships->CreateOrReplace("room1", "r2", Relationship("contains", "room2"), "W/\"x\""); });
}

void TestUpdate() {
  Fixture f;
  auto    created = f.relationships->CreateOrReplace("room1", "r1", Relationship("contains", "room2"));
  f.now += std::chrono::seconds(1);

  auto updated = f.relationships->Update(
      "room1", "r1", Json::parse(R"([{ "op": "add", "path": "/since", "value": "2024-02-01T08:00:00Z" }])"));
  assert(updated["since"] == "2024-02-01T08:00:00Z");
  assert(updated["$etag"] != created["$etag"]);
  assert(f.relationships->Get("room1", "r1") == updated);

  auto reserved = Expect<twingraph::util::ValidationFailed>([&] {
    (void)f.relationships->Update("room1", "r1",
                                  Json::parse(R"([{ "op": "replace", "path": "/$targetId", "value": "device1" }])"));
  });
  assert(std::string(reserved.what()) == "Cannot update the $targetId property");

  (void)Expect<twingraph::util::ValidationFailed>([&] {
    (void)f.relationships->Update("room1", "r1",
                                  Json::parse(R"([{ "op": "replace", "path": "/since", "value": 12 }])"));
  });

  (void)Expect<twingraph::util::PreconditionFailed>([&] {
    (void)f.relationships->Update("room1", "r1", Json::parse(R"([{ "op": "remove", "path": "/since" }])"),
                                  created["$etag"].get<std::string>());
  });

  auto removed = f.relationships->Update("room1", "r1", Json::parse(R"([{ "op": "remove", "path": "/since" }])"),
                                         updated["$etag"].get<std::string>());
  assert(!removed.contains("since"));

  (void)Expect<twingraph::util::RelationshipNotFound>([&] {
    (void)f.relationships->Update("room1", "nope", Json::parse(R"([{ "op": "remove", "path": "/since" }])"));
  });
}

void TestDelete() {
  Fixture f;
  (void)f.relationships->CreateOrReplace("room1", "r1", Relationship("contains", "room2"));

  f.relationships->Delete("room1", "r1");
  (void)Expect<twingraph::util::RelationshipNotFound>([&] { (void)f.relationships->Get("room1", "r1"); });
  (void)Expect<twingraph::util::RelationshipNotFound>([&] { f.relationships->Delete("room1", "r1"); });

  // edges gone, so the twin can go too
  f.twins->Delete("room2");
}

void TestBatchReportsEveryItemInOrder() {
  Fixture f;

  std::vector<Json> batch = {
      BatchItem("room1", "r1", "contains", "room2"),
      Json("not an object"),
      BatchItem("room1", "r2", "feeds", "device1"),
      Json{{"$sourceId", "room1"}, {"$relationshipId", "r3"}, {"$relationshipName", "feeds"}},
      BatchItem("ghost", "r4", "feeds", "room1"),
      BatchItem("room2", "r5", "contains", "phantom"),
  };

  auto result = f.relationships->CreateOrReplaceMany(batch);
  assert(result.results.size() == batch.size());
  assert(result.SuccessCount() == 2);
  assert(result.FailureCount() == 4);

  assert(result.results[0].success && result.results[0].relationship_id == "r1");
  assert(!result.results[1].success && result.results[1].error == "Relationship must be a JSON object");
  assert(result.results[2].success);
  assert(result.results[3].error == "Target ID ($targetId) is required");
  assert(result.results[4].error == "Source twin 'ghost' does not exist");
  assert(result.results[5].error == "Target twin 'phantom' does not exist");

  auto stored = f.relationships->Get("room1", "r2");
  assert(stored["$etag"] == twingraph::util::GenerateEtag("room1-r2", f.now));
  assert(f.relationships->List("room1").size() == 2);
}

void TestBatchGroupFailureIsIsolated() {
  Fixture f;
  f.store->failing_name = "feeds";

  auto result = f.relationships->CreateOrReplaceMany({
      BatchItem("room1", "r1", "contains", "room2"),
      BatchItem("room1", "r2", "feeds", "device1"),
      BatchItem("room2", "r3", "feeds", "device1"),
  });

  assert(result.SuccessCount() == 1);
  assert(result.results[0].success);
  assert(result.results[1].error == "Database operation failed: connection reset");
  assert(result.results[2].error == "Database operation failed: connection reset");
  assert(f.relationships->List("room1").size() == 1);
}

void TestBatchReportsEndpointsDeletedBeforeTheWrite() {
  Fixture f;
  f.store->vanishing_twin = "device1";

  auto result = f.relationships->CreateOrReplaceMany({
      BatchItem("room1", "r1", "feeds", "room2"),
      BatchItem("room1", "r2", "feeds", "device1"),
      BatchItem("room2", "r3", "contains", "room1"),
  });

  assert(result.SuccessCount() == 2);
  assert(result.results[0].success);
  assert(!result.results[1].success);
  assert(result.results[1].error == "Source twin 'room1' or target twin 'device1' no longer exists");
  assert(result.results[2].success);
  assert(f.relationships->List("room1").size() == 1);
  assert(f.relationships->List("room2").size() == 1);
}

void TestBatchLimits() {
  EntityLimits limits;
  limits.max_batch_relationships = 2;
  Fixture f(limits);

  (void)Expect<twingraph::util::InvalidArgument>([&] { (void)f.relationships->CreateOrReplaceMany({}); });

  auto too_many = Expect<twingraph::util::InvalidArgument>([&] {
    (void)f.relationships->CreateOrReplaceMany({BatchItem("room1", "r1", "feeds", "room2"),
                                                BatchItem("room1", "r2", "feeds", "room2"),
                                                BatchItem("room1", "r3", "feeds", "room2")});
  });
  assert(std::string(too_many.what()) == "Cannot process more than 2 relationships in a single batch");
}

} // namespace

int main() {
  TestCreateAndRead();
  TestCreateRejectsMalformedPayloads();
  TestCreateValidatesAgainstTheModel();
  TestIfNoneMatch();
  TestUpdate();
  TestDelete();
  TestBatchReportsEveryItemInOrder();
  TestBatchGroupFailureIsIsolated();
  TestBatchReportsEndpointsDeletedBeforeTheWrite();
  TestBatchLimits();

  std::cout << "twingraph_unit_relationship_service: pass\n";
  return 0;
}
