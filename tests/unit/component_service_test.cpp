#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dtdl/model_parser.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/twins/component_service.hpp"
#include "internal/twins/digital_twin_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using twingraph::dtdl::DtdlModelParser;
using twingraph::graph::ErrorCode;
using twingraph::graph::PropertyMutation;
using twingraph::graph::Result;
using twingraph::graph::memory::MemoryGraphStore;
using twingraph::models::ModelRegistry;
using twingraph::twins::ComponentService;
using twingraph::twins::DigitalTwinService;
using twingraph::twins::EntityLimits;
using twingraph::util::Json;
using twingraph::util::TimePoint;
using twingraph::util::ToIso8601;

const char* kThermostat = R"({
  "@id": "dtmi:example:Thermostat;1",
  "@type": "Interface",
  "contents": [
    { "@type": "Property", "name": "setPoint", "schema": "double" },
    { "@type": "Property", "name": "mode", "schema": "string" }
  ]
})";

const char* kRoom = R"({
  "@id": "dtmi:example:Room;1",
  "@type": "Interface",
  "contents": [
    { "@type": "Property", "name": "temperature", "schema": "double" },
    { "@type": "Component", "name": "thermostat", "schema": "dtmi:example:Thermostat;1" }
  ]
})";

class ContendedGraphStore : public MemoryGraphStore {
 public:
  int conflicts = 0;

  Result MutateTwin(const std::string& id, const std::vector<PropertyMutation>& mutations,
                    const std::string& expected_etag) override {
    if (conflicts > 0) {
      --conflicts;
      return Result::Err(ErrorCode::Conflict);
    }
    return MemoryGraphStore::MutateTwin(id, mutations, expected_etag);
  }
};

struct Fixture {
  TimePoint                            now{std::chrono::seconds(1704067200)};
  std::shared_ptr<ContendedGraphStore> store = std::make_shared<ContendedGraphStore>();
  std::shared_ptr<ModelRegistry>       registry;
  std::unique_ptr<DigitalTwinService>  twins;
  std::unique_ptr<ComponentService>    components;

  Fixture() {
    auto clock = [this] { return now; };
    registry   = std::make_shared<ModelRegistry>(store, std::make_shared<DtdlModelParser>(),
                                               std::chrono::seconds(10), clock);
    twins      = std::make_unique<DigitalTwinService>(store, registry, EntityLimits{}, clock);
    components = std::make_unique<ComponentService>(store, registry, EntityLimits{}, clock);

    (void)registry->CreateModels({kThermostat, kRoom});
    (void)twins->CreateOrReplace("room1",
                                 Json{{"$metadata", {{"$model", "dtmi:example:Room;1"}}}, {"temperature", 20.0}});
  }
};

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

Json SetPoint(double value) {
  return Json::array({Json{{"op", "add"}, {"path", "/setPoint"}, {"value", value}}});
}

void TestGetReportsMissingComponents() {
  Fixture f;

  auto absent = Expect<twingraph::util::ComponentNotFound>([&] { (void)f.components->Get("room1", "thermostat"); });
  assert(std::string(absent.what()) == "Component 'thermostat' not found on digital twin 'room1'");

  auto undeclared = Expect<twingraph::util::ComponentNotFound>([&] { (void)f.components->Get("room1", "lamp"); });
  assert(std::string(undeclared.what()) == "Component 'lamp' is not defined in the model 'dtmi:example:Room;1'");

  (void)Expect<twingraph::util::ComponentNotFound>([&] { (void)f.components->Get("room1", "temperature"); });
  (void)Expect<twingraph::util::TwinNotFound>([&] { (void)f.components->Get("ghost", "thermostat"); });
}

void TestUpdateCreatesAndStampsComponent() {
  Fixture    f;
  const auto before = f.twins->Get("room1");
  f.now += std::chrono::seconds(1);
  const auto stamp = ToIso8601(f.now);

  auto component = f.components->Update("room1", "thermostat", SetPoint(21.0));
  assert(component["setPoint"] == 21.0);
  assert(component["$metadata"]["$lastUpdateTime"] == stamp);
  assert(component["$metadata"]["setPoint"]["lastUpdateTime"] == stamp);

  const auto twin = f.twins->Get("room1");
  assert(twin["thermostat"] == component);
  assert(twin["$metadata"]["thermostat"]["lastUpdateTime"] == stamp);
  assert(twin["$metadata"]["$lastUpdateTime"] == stamp);
  assert(twin["$metadata"]["temperature"] == before["$metadata"]["temperature"]);
  assert(twin["temperature"] == 20.0);
  assert(twin["$etag"] != before["$etag"]);

  assert(f.components->Get("room1", "thermostat") == component);
}

void TestUpdateMergesIntoExistingComponent() {
  Fixture f;
  (void)f.components->Update("room1", "thermostat", SetPoint(21.0));
  f.now += std::chrono::seconds(5);

  auto component = f.components->Update(
      "room1", "thermostat",
      Json::parse(R"([{ "op": "add", "path": "/mode", "value": "heat" }, { "op": "remove", "path": "/setPoint" }])"));
  assert(component["mode"] == "heat");
  assert(!component.contains("setPoint"));
  assert(!component["$metadata"].contains("setPoint"));
  assert(component["$metadata"]["mode"]["lastUpdateTime"] == ToIso8601(f.now));
}

void TestUpdateValidatesAgainstComponentSchema() {
  Fixture f;

  auto error = Expect<twingraph::util::ValidationFailed>([&] {
    (void)f.components->Update("room1", "thermostat", Json::parse(R"([
      { "op": "add", "path": "/setPoint", "value": "warm" },
      { "op": "add", "path": "/fan", "value": true }
    ])"));
  });
  assert(error.violations().size() == 2);
  assert(error.violations()[0] == "Component 'thermostat' property 'setPoint': \"warm\" is not a valid double value");
  assert(error.violations()[1] == "Property 'fan' is not defined in component 'thermostat' schema");

  (void)Expect<twingraph::util::ValidationFailed>([&] {
    (void)f.components->Update("room1", "thermostat",
                               Json::parse(R"([{ "op": "add", "path": "/$metadata", "value": {} }])"));
  });

  (void)Expect<twingraph::util::ValidationFailed>([&] {
    (void)f.components->Update("room1", "thermostat", Json::parse(R"([{ "op": "remove", "path": "/missing" }])"));
  });

  (void)Expect<twingraph::util::ComponentNotFound>(
      [&] { (void)f.components->Update("room1", "lamp", SetPoint(1.0)); });

  assert(!f.twins->Get("room1").contains("thermostat"));
}

void TestUpdateConcurrency() {
  Fixture f;

  (void)Expect<twingraph::util::PreconditionFailed>(
      [&] { (void)f.components->Update("room1", "thermostat", SetPoint(21.0), "W/\"stale\""); });

  f.store->conflicts = 1;
  auto component     = f.components->Update("room1", "thermostat", SetPoint(22.0));
  assert(component["setPoint"] == 22.0);

  const auto etag    = f.twins->Get("room1")["$etag"].get<std::string>();
  f.store->conflicts = 1;
  (void)Expect<twingraph::util::PreconditionFailed>(
      [&] { (void)f.components->Update("room1", "thermostat", SetPoint(23.0), etag); });

  (void)Expect<twingraph::util::TwinNotFound>(
      [&] { (void)f.components->Update("ghost", "thermostat", SetPoint(1.0)); });
}

} // namespace

int main() {
  TestGetReportsMissingComponents();
  TestUpdateCreatesAndStampsComponent();
  TestUpdateMergesIntoExistingComponent();
  TestUpdateValidatesAgainstComponentSchema();
  TestUpdateConcurrency();

  std::cout << "twingraph_unit_component_service: pass\n";
  return 0;
}
