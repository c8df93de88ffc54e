#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/dtdl/model_parser.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using twingraph::dtdl::DtdlModelParser;
using twingraph::graph::memory::MemoryGraphStore;
using twingraph::models::GetModelsOptions;
using twingraph::models::ModelData;
using twingraph::models::ModelRegistry;
using twingraph::util::Json;
using twingraph::util::TimePoint;

const char* kSpace = R"({
  "@id": "dtmi:example:Space;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "displayName": "Space",
  "contents": [
    { "@type": "Property", "name": "name", "schema": "string" },
    { "@type": "Relationship", "name": "contains", "target": "dtmi:example:Space;1" }
  ]
})";

const char* kThermostat = R"({
  "@id": "dtmi:example:Thermostat;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "contents": [ { "@type": "Property", "name": "setPoint", "schema": "double" } ]
})";

const char* kRoom = R"({
  "@id": "dtmi:example:Room;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "extends": "dtmi:example:Space;1",
  "displayName": { "en": "Room", "de": "Raum" },
  "contents": [
    { "@type": "Property", "name": "temperature", "schema": "double" },
    { "@type": "Component", "name": "thermostat", "schema": "dtmi:example:Thermostat;1" },
    { "@type": "Relationship", "name": "feeds" }
  ]
})";

const char* kMeetingRoom = R"({
  "@id": "dtmi:example:MeetingRoom;1",
  "@type": "Interface",
  "extends": "dtmi:example:Room;1"
})";

struct Fixture {
  TimePoint                         now{std::chrono::seconds(1704067200)};
  std::shared_ptr<MemoryGraphStore> store = std::make_shared<MemoryGraphStore>();
  std::shared_ptr<ModelRegistry>    registry;

  explicit Fixture(std::chrono::milliseconds ttl = std::chrono::seconds(10)) {
    registry = std::make_shared<ModelRegistry>(store, std::make_shared<DtdlModelParser>(), ttl,
                                               [this] { return now; });
  }
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestCreateStoresModelsWithBasesAndEdges() {
  Fixture f;
  auto    created = f.registry->CreateModels({kSpace, kThermostat, kRoom});

  assert(created.size() == 3);
  const auto& room = created[2];
  assert(room.id == "dtmi:example:Room;1");
  assert((room.bases == std::vector<std::string>{"dtmi:example:Space;1"}));
  assert(room.upload_time == "2024-01-01T00:00:00.0000000Z");
  assert(room.display_name["de"] == "Raum");
  assert(created[0].display_name == (Json{{"en", "Space"}}));

  assert(f.store->ModelEdgeCount("_extends") == 1);
  assert(f.store->ModelEdgeCount("_hasComponent") == 1);
  assert(f.store->HasEdgeLabel("contains"));
  assert(f.store->HasEdgeLabel("feeds"));
}

void TestCreateResolvesStoredDependencies() {
  Fixture f;
  (void)f.registry->CreateModels({kSpace, kThermostat});
  auto created = f.registry->CreateModels({kRoom});

  assert(created.size() == 1);
  assert((created.front().bases == std::vector<std::string>{"dtmi:example:Space;1"}));
  assert(f.store->ModelEdgeCount("_extends") == 1);
  assert(f.store->ModelEdgeCount("_hasComponent") == 1);

  auto derived = f.registry->CreateModels({kMeetingRoom});
  assert((derived.front().bases == std::vector<std::string>{"dtmi:example:Room;1", "dtmi:example:Space;1"}));
}

void TestBasesAreClosedWhateverTheDeclarationOrder() {
  const char* lab = R"({
    "@id": "dtmi:example:Lab;1", "@type": "Interface", "extends": "dtmi:example:Workspace;1"
  })";
  const char* workspace = R"({
    "@id": "dtmi:example:Workspace;1", "@type": "Interface", "extends": "dtmi:example:Area;1"
  })";
  const char* area = R"({ "@id": "dtmi:example:Area;1", "@type": "Interface" })";

  Fixture f;
  auto    created = f.registry->CreateModels({lab, workspace, area});

  assert(created.size() == 3);
  assert(created[0].id == "dtmi:example:Lab;1");
  assert((created[0].bases == std::vector<std::string>{"dtmi:example:Workspace;1", "dtmi:example:Area;1"}));
  assert((created[1].bases == std::vector<std::string>{"dtmi:example:Area;1"}));
  assert(created[2].bases.empty());
  assert(f.store->ModelEdgeCount("_extends") == 2);

  assert(f.registry->IsOfModel("dtmi:example:Lab;1", "dtmi:example:Area;1"));
  assert(!f.registry->IsOfModel("dtmi:example:Lab;1", "dtmi:example:Area;1", true));
}

void TestArrayDocumentCreatesEachInterface() {
  Fixture    f;
  const auto batch   = std::string("[") + kSpace + "," + kThermostat + "]";
  auto       created = f.registry->CreateModels({batch});
  assert(created.size() == 2);
  assert(f.registry->GetModels().size() == 2);
}

void TestCreateRejectsBadInput() {
  Fixture f;

  assert(Throws<twingraph::util::InvalidArgument>([&] { (void)f.registry->CreateModels({}); }));
  assert(Throws<twingraph::util::ModelParsingError>([&] { (void)f.registry->CreateModels({"{ nope"}); }));
  assert(Throws<twingraph::util::ModelParsingError>([&] { (void)f.registry->CreateModels({kRoom}); }));
  assert(Throws<twingraph::util::ModelAlreadyExists>([&] { (void)f.registry->CreateModels({kSpace, kSpace}); }));

  (void)f.registry->CreateModels({kSpace});
  assert(Throws<twingraph::util::ModelAlreadyExists>([&] { (void)f.registry->CreateModels({kSpace}); }));

  // a failed batch stores nothing
  assert(Throws<twingraph::util::ModelAlreadyExists>(
      [&] { (void)f.registry->CreateModels({kThermostat, kSpace}); }));
  assert(Throws<twingraph::util::ModelNotFound>([&] { (void)f.registry->GetModel("dtmi:example:Thermostat;1"); }));
}

void TestGetModels() {
  Fixture f;
  (void)f.registry->CreateModels({kSpace, kThermostat, kRoom});

  auto all = f.registry->GetModels();
  assert(all.size() == 3);
  assert(std::none_of(all.begin(), all.end(), [](const ModelData& m) { return m.model.has_value(); }));

  GetModelsOptions options;
  options.dependencies_for         = {"dtmi:example:Room;1"};
  options.include_model_definition = true;
  auto dependencies                = f.registry->GetModels(options);
  assert(dependencies.size() == 2);
  assert(dependencies[0].id == "dtmi:example:Room;1");
  assert(dependencies[1].id == "dtmi:example:Space;1");
  assert(dependencies[0].model && (*dependencies[0].model)["@id"] == "dtmi:example:Room;1");

  auto single = f.registry->GetModel("dtmi:example:Room;1");
  assert(single.model.has_value());

  bool threw = false;
  try {
    (void)f.registry->GetModel("dtmi:example:Nothing;1");
  } catch (const twingraph::util::ModelNotFound& e) {
    threw = std::string(e.what()) == "Model with ID dtmi:example:Nothing;1 not found";
  }
  assert(threw && "Missing models must report their id.");
}

void TestIsOfModelFollowsBases() {
  Fixture f;
  (void)f.registry->CreateModels({kSpace, kThermostat, kRoom, kMeetingRoom});

  assert(f.registry->IsOfModel("dtmi:example:MeetingRoom;1", "dtmi:example:Space;1"));
  assert(f.registry->IsOfModel("dtmi:example:Room;1", "dtmi:example:Room;1", true));
  assert(!f.registry->IsOfModel("dtmi:example:Room;1", "dtmi:example:Space;1", true));
  assert(!f.registry->IsOfModel("dtmi:example:Space;1", "dtmi:example:Room;1"));
}

void TestResolveInterfaceIncludesInheritedContents() {
  Fixture f(std::chrono::milliseconds(0));
  (void)f.registry->CreateModels({kSpace, kThermostat});
  (void)f.registry->CreateModels({kRoom});

  auto resolved = f.registry->ResolveInterface("dtmi:example:Room;1");
  assert(resolved.info != nullptr);
  assert(resolved.info->FindContent("name") != nullptr);
  assert(resolved.info->FindContent("temperature") != nullptr);
  assert(resolved.Find("dtmi:example:Thermostat;1") != nullptr);

  assert(Throws<twingraph::util::ModelNotFound>(
      [&] { (void)f.registry->ResolveInterface("dtmi:example:Nothing;1"); }));
}

void TestDeleteRespectsDependencies() {
  Fixture f;
  (void)f.registry->CreateModels({kSpace, kThermostat, kRoom});
  (void)f.registry->GetModel("dtmi:example:Room;1");

  assert(Throws<twingraph::util::ReferentialIntegrityError>(
      [&] { f.registry->DeleteModel("dtmi:example:Space;1"); }));

  f.registry->DeleteModel("dtmi:example:Room;1");
  assert(Throws<twingraph::util::ModelNotFound>([&] { (void)f.registry->GetModel("dtmi:example:Room;1"); }));

  f.registry->DeleteModel("dtmi:example:Space;1");
  assert(Throws<twingraph::util::ModelNotFound>([&] { f.registry->DeleteModel("dtmi:example:Space;1"); }));

  f.registry->DeleteAllModels();
  assert(f.registry->GetModels().empty());
  assert(Throws<twingraph::util::ModelNotFound>([&] { f.registry->DeleteAllModels(); }));
}

void TestTwinModelLookup() {
  Fixture f;

  Json twin = {{"$dtId", "room1"}, {"$etag", "W/\"x\""}, {"$metadata", {{"$model", "dtmi:example:Room;1"}}}};
  auto stored = f.store->UpsertTwin(twin);
  assert(stored);
  assert(f.registry->GetTwinModelId("room1") == "dtmi:example:Room;1");

  // served from the cache until forgotten
  twin["$metadata"]["$model"] = "dtmi:example:Room;2";
  stored = f.store->UpsertTwin(twin);
  assert(stored);
  assert(f.registry->GetTwinModelId("room1") == "dtmi:example:Room;1");
  f.registry->ForgetTwin("room1");
  assert(f.registry->GetTwinModelId("room1") == "dtmi:example:Room;2");

  stored = f.store->UpsertTwin(Json{{"$dtId", "bare"}});
  assert(stored);
  assert(Throws<twingraph::util::ValidationFailed>([&] { (void)f.registry->GetTwinModelId("bare"); }));
  assert(Throws<twingraph::util::TwinNotFound>([&] { (void)f.registry->GetTwinModelId("ghost"); }));
}

} // namespace

int main() {
  TestCreateStoresModelsWithBasesAndEdges();
  TestCreateResolvesStoredDependencies();
  TestBasesAreClosedWhateverTheDeclarationOrder();
  TestArrayDocumentCreatesEachInterface();
  TestCreateRejectsBadInput();
  TestGetModels();
  TestIsOfModelFollowsBases();
  TestResolveInterfaceIncludesInheritedContents();
  TestDeleteRespectsDependencies();
  TestTwinModelLookup();

  std::cout << "twingraph_unit_model_registry: pass\n";
  return 0;
}
