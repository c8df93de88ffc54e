#include "internal/dtdl/model_parser.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

using namespace twingraph::dtdl;
using twingraph::util::Json;
using twingraph::util::ModelParsingError;

namespace {

const char* kSpace = R"({
  "@id": "dtmi:example:Space;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "displayName": "Space",
  "contents": [
    { "@type": "Property", "name": "name", "schema": "string" },
    { "@type": "Relationship", "name": "contains", "target": "dtmi:example:Space;1",
      "properties": [ { "name": "since", "schema": "dateTime" } ] }
  ]
})";

const char* kRoom = R"({
  "@id": "dtmi:example:Room;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "extends": "dtmi:example:Space;1",
  "contents": [
    { "@type": ["Property", "Temperature"], "name": "temperature", "schema": "double", "writable": true },
    { "@type": "Telemetry", "name": "humidity", "schema": "double" },
    { "@type": "Component", "name": "thermostat", "schema": "dtmi:example:Thermostat;1" }
  ]
})";

const char* kThermostat = R"({
  "@id": "dtmi:example:Thermostat;1",
  "@type": "Interface",
  "@context": "dtmi:dtdl:context;2",
  "contents": [ { "@type": "Property", "name": "setPoint", "schema": "integer" } ]
})";

bool HasViolation(const ModelParsingError& error, const std::string& needle) {
  const auto& violations = error.violations();
  return std::any_of(violations.begin(), violations.end(),
                     [&](const std::string& v) { return v.find(needle) != std::string::npos; });
}

template <typename Fn>
ModelParsingError ExpectParsingError(Fn&& fn) {
  try {
    fn();
  } catch (const ModelParsingError& e) {
    return e;
  }
  assert(false && "expected ModelParsingError");
  return ModelParsingError(std::vector<std::string>{});
}

void TestParsesContentsAndInheritance() {
  DtdlModelParser parser;
  auto            model = parser.Parse({kSpace, kRoom, kThermostat}, nullptr);

  assert((model.roots == std::vector<std::string>{"dtmi:example:Space;1", "dtmi:example:Room;1",
                                                  "dtmi:example:Thermostat;1"}));

  const auto* room = model.Find("dtmi:example:Room;1");
  assert(room != nullptr);
  assert((room->extends == std::vector<std::string>{"dtmi:example:Space;1"}));

  const auto* name = room->FindContent("name");
  assert(name != nullptr);
  assert(name->kind == ContentKind::Property);
  assert(name->defined_in == "dtmi:example:Space;1");

  const auto* temperature = room->FindContent("temperature");
  assert(temperature != nullptr && temperature->writable);
  assert(temperature->schema->kind == SchemaKind::Double);

  assert(room->FindContent("humidity")->kind == ContentKind::Telemetry);

  const auto* thermostat = room->FindContent("thermostat");
  assert(thermostat->kind == ContentKind::Component);
  assert(thermostat->component_schema == "dtmi:example:Thermostat;1");

  const auto* contains = room->FindContent("contains");
  assert(contains->kind == ContentKind::Relationship);
  assert(contains->target == "dtmi:example:Space;1");
  assert(contains->properties.size() == 1);
  assert(contains->properties.front().name == "since");
}

void TestResolverSuppliesMissingBases() {
  DtdlModelParser          parser;
  std::vector<std::string> requested;

  auto model = parser.Parse({kRoom}, [&](const std::vector<std::string>& ids) {
    requested.insert(requested.end(), ids.begin(), ids.end());
    std::vector<std::string> found;
    for (const auto& id : ids) {
      if (id == "dtmi:example:Space;1") found.push_back(kSpace);
      if (id == "dtmi:example:Thermostat;1") found.push_back(kThermostat);
    }
    return found;
  });

  assert(requested.size() == 2);
  assert((model.roots == std::vector<std::string>{"dtmi:example:Room;1"}));
  assert(model.Find("dtmi:example:Space;1") != nullptr);
  assert(model.Find("dtmi:example:Room;1")->FindContent("contains") != nullptr);
}

void TestInlineComponentInterface() {
  const char* kDevice = R"({
    "@id": "dtmi:example:Device;1",
    "@type": "Interface",
    "contents": [
      { "@type": "Component", "name": "info",
        "schema": { "@id": "dtmi:example:DeviceInfo;1", "@type": "Interface",
                    "contents": [ { "@type": "Property", "name": "serial", "schema": "string" } ] } }
    ]
  })";

  DtdlModelParser parser;
  auto            model = parser.Parse({kDevice}, nullptr);
  assert((model.roots == std::vector<std::string>{"dtmi:example:Device;1"}));
  assert(model.Find("dtmi:example:Device;1")->FindContent("info")->component_schema == "dtmi:example:DeviceInfo;1");
  assert(model.Find("dtmi:example:DeviceInfo;1")->FindContent("serial") != nullptr);
}

void TestArrayDocumentDefinesSeveralInterfaces() {
  const std::string batch = std::string("[") + kSpace + "," + kThermostat + "]";

  DtdlModelParser parser;
  auto            model = parser.Parse({batch}, nullptr);
  assert(model.roots.size() == 2);
}

void TestUnresolvedBaseIsReported() {
  const char* kOrphan = R"({
    "@id": "dtmi:example:Orphan;1",
    "@type": "Interface",
    "extends": "dtmi:example:Missing;1"
  })";

  DtdlModelParser parser;
  auto error = ExpectParsingError([&] { (void)parser.Parse({kOrphan}, nullptr); });
  assert(HasViolation(error, "Unable to resolve reference to dtmi:example:Missing;1"));
}

void TestReportsAllProblemsTogether() {
  const char* kBroken = R"({
    "@id": "dtmi:example:Broken;1",
    "@type": "Interface",
    "contents": [
      { "@type": "Property", "name": "x", "schema": "notASchema" },
      { "@type": "Property", "name": "y", "schema": "alsoMissing" }
    ]
  })";

  DtdlModelParser parser;
  auto error = ExpectParsingError([&] { (void)parser.Parse({kBroken}, nullptr); });
  assert(error.violations().size() == 2);
  assert(HasViolation(error, "Unknown schema 'notASchema'"));
  assert(HasViolation(error, "Unknown schema 'alsoMissing'"));
}

void TestRejectsInvalidDocuments() {
  DtdlModelParser parser;

  auto not_json = ExpectParsingError([&] { (void)parser.Parse({"{ not json"}, nullptr); });
  assert(HasViolation(not_json, "Invalid JSON document"));

  auto bad_id = ExpectParsingError(
      [&] { (void)parser.Parse({R"({"@id": "room", "@type": "Interface"})"}, nullptr); });
  assert(HasViolation(bad_id, "missing or invalid @id"));

  auto duplicate = ExpectParsingError([&] { (void)parser.Parse({kSpace, kSpace}, nullptr); });
  assert(HasViolation(duplicate, "Duplicate definition of dtmi:example:Space;1"));

  auto unknown_schema = ExpectParsingError([&] {
    (void)parser.Parse({R"({"@id": "dtmi:example:A;1", "@type": "Interface",
                            "contents": [{"@type": "Property", "name": "p", "schema": "quaternion"}]})"},
                       nullptr);
  });
  assert(HasViolation(unknown_schema, "Unknown schema 'quaternion'"));
}

void TestRejectsExtendsCycles() {
  const char* kA = R"({"@id": "dtmi:example:A;1", "@type": "Interface", "extends": "dtmi:example:B;1"})";
  const char* kB = R"({"@id": "dtmi:example:B;1", "@type": "Interface", "extends": "dtmi:example:A;1"})";

  DtdlModelParser parser;
  auto            error = ExpectParsingError([&] { (void)parser.Parse({kA, kB}, nullptr); });
  assert(HasViolation(error, "Cycle in extends"));
}

void TestRejectsRedefinedInheritedContent() {
  const char* kShadow = R"({
    "@id": "dtmi:example:Shadow;1",
    "@type": "Interface",
    "extends": "dtmi:example:Space;1",
    "contents": [ { "@type": "Property", "name": "name", "schema": "integer" } ]
  })";

  DtdlModelParser parser;
  auto            error = ExpectParsingError([&] { (void)parser.Parse({kSpace, kShadow}, nullptr); });
  assert(HasViolation(error, "redefines inherited content"));
}

void TestSchemaValidation() {
  const char* kSensor = R"({
    "@id": "dtmi:example:Sensor;1",
    "@type": "Interface",
    "schemas": [
      { "@id": "dtmi:example:Mode;1", "@type": "Enum", "valueSchema": "string",
        "enumValues": [ { "name": "on", "enumValue": "on" }, { "name": "off", "enumValue": "off" } ] }
    ],
    "contents": [
      { "@type": "Property", "name": "count", "schema": "integer" },
      { "@type": "Property", "name": "seen", "schema": "dateTime" },
      { "@type": "Property", "name": "mode", "schema": "dtmi:example:Mode;1" },
      { "@type": "Property", "name": "position", "schema": { "@type": "Object", "fields": [
          { "name": "x", "schema": "double" }, { "name": "y", "schema": "double" } ] } },
      { "@type": "Property", "name": "tags", "schema": { "@type": "Map",
          "mapKey": { "name": "key", "schema": "string" }, "mapValue": { "name": "value", "schema": "string" } } },
      { "@type": "Property", "name": "samples", "schema": { "@type": "Array", "elementSchema": "long" } }
    ]
  })";

  DtdlModelParser parser;
  auto            model  = parser.Parse({kSensor}, nullptr);
  const auto*     sensor = model.Find("dtmi:example:Sensor;1");

  auto check = [&](const std::string& name, const Json& value) {
    return sensor->FindContent(name)->schema->ValidateInstance(value);
  };

  assert(check("count", 7).empty());
  assert(!check("count", 3000000000LL).empty());
  assert(!check("count", 1.5).empty());

  assert(check("seen", "2024-01-01T00:00:00Z").empty());
  assert(!check("seen", "yesterday").empty());

  assert(check("mode", "on").empty());
  assert(!check("mode", "standby").empty());

  assert(check("position", Json{{"x", 1.0}, {"y", 2}}).empty());
  assert(!check("position", Json{{"z", 1.0}}).empty());
  assert(!check("position", Json{{"x", "left"}}).empty());

  assert(check("tags", Json{{"a", "b"}}).empty());
  assert(!check("tags", Json{{"a", 1}}).empty());

  assert(check("samples", Json::array({1, 2, 3})).empty());
  assert(!check("samples", Json::array({1, "two"})).empty());
}

void TestDtmiSyntax() {
  assert(IsValidDtmi("dtmi:example:Room;1"));
  assert(IsValidDtmi("dtmi:com:example:Thermostat;12"));
  assert(!IsValidDtmi("dtmi:example:Room;0"));
  assert(!IsValidDtmi("example:Room;1"));
  assert(!IsValidDtmi("dtmi:example:Room_;1"));
}

} // namespace

int main() {
  TestParsesContentsAndInheritance();
  TestResolverSuppliesMissingBases();
  TestInlineComponentInterface();
  TestArrayDocumentDefinesSeveralInterfaces();
  TestUnresolvedBaseIsReported();
  TestReportsAllProblemsTogether();
  TestRejectsInvalidDocuments();
  TestRejectsExtendsCycles();
  TestRejectsRedefinedInheritedContent();
  TestSchemaValidation();
  TestDtmiSyntax();

  std::cout << "twingraph_unit_dtdl: pass\n";
  return 0;
}
