#include <exception>
#include <iostream>
#include <string>

#include "twingraph/v1.hpp"

using namespace twingraph::v1;

namespace {

const char* kRoomModel = R"({
  "@context": "dtmi:dtdl:context;3",
  "@id": "dtmi:example:Room;1",
  "@type": "Interface",
  "displayName": "Room",
  "contents": [
    {"@type": "Property", "name": "name", "schema": "string"},
    {"@type": "Property", "name": "temperature", "schema": "double", "writable": true},
    {"@type": "Relationship", "name": "adjacentTo", "target": "dtmi:example:Room;1"}
  ]
})";

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config; without one the in-memory store is used.
  RuntimeConfig config;
  try {
    if (argc > 1) {
      config = ConfigLoader::LoadFromYaml(argv[1]);
    }
    twingraph::observability::InitializeLogging(config);

    auto client = BuildClient(config);

    client->CreateModels({kRoomModel});

    const Json kitchen = {{"$metadata", {{"$model", "dtmi:example:Room;1"}}}, {"name", "Kitchen"}, {"temperature", 21.5}};
    const Json hall    = {{"$metadata", {{"$model", "dtmi:example:Room;1"}}}, {"name", "Hall"}};
    client->CreateOrReplaceDigitalTwin("kitchen", kitchen);
    client->CreateOrReplaceDigitalTwin("hall", hall);

    client->CreateOrReplaceRelationship("kitchen", "k-h",
                                        {{"$relationshipName", "adjacentTo"}, {"$targetId", "hall"}});

    const auto updated = client->UpdateDigitalTwin(
        "kitchen", Json::array({{{"op", "replace"}, {"path", "/temperature"}, {"value", 23.0}}}));
    std::cout << "kitchen: " << updated.dump(2) << '\n';

    for (const auto& relationship : client->GetRelationships("kitchen")) {
      std::cout << "relationship: " << relationship.dump() << '\n';
    }

    // Cypher needs a graph engine; the in-memory store rejects it.
    if (config.database().has_postgres()) {
      auto page = client->Query("SELECT * FROM DIGITALTWINS WHERE IS_OF_MODEL('dtmi:example:Room;1')");
      std::cout << "query returned " << page.items.size() << " twins\n";
    }

    client->DeleteRelationship("kitchen", "k-h");
    client->DeleteDigitalTwin("kitchen");
    client->DeleteDigitalTwin("hall");
  } catch (const std::exception& e) {
    std::cerr << "example failed: " << e.what() << '\n';
    twingraph::observability::ShutdownLogging();
    return 1;
  }

  twingraph::observability::ShutdownLogging();
  return 0;
}
