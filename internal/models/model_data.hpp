#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/json.hpp"

namespace twingraph::models {

using util::Json;

/*
  Stored form of one interface definition (a Model vertex).

  JSON shape:
    { "id", "model", "uploadTime", "displayName", "description",
      "decommissioned", "bases" }
  displayName/description are language maps; a plain string in the
  definition is stored as {"en": <string>}.
*/
struct ModelData {
  std::string id;
  // Raw definition; empty when a listing omitted it.
  std::optional<Json>      model;
  std::string              upload_time;
  Json                     display_name = Json::object();
  Json                     description  = Json::object();
  bool                     decommissioned = false;
  std::vector<std::string> bases;

  Json ToJson() const;

  // Tolerant of missing fields; throws InvalidArgument without an id.
  static ModelData FromJson(const Json& stored);

  static ModelData FromDefinition(const Json& definition, std::string upload_time);
};

} // namespace twingraph::models
