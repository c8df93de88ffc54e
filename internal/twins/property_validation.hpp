#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/dtdl/object_model.hpp"
#include "internal/util/json.hpp"

namespace twingraph::twins {

using util::Json;

bool IsReservedTwinKey(std::string_view key);
bool IsReservedRelationshipKey(std::string_view key);

// Root keys of an object that are not reserved, in document order.
std::vector<std::string> UserKeys(const Json& object, bool (*reserved)(std::string_view));

/*
  Property validation

  Each function appends human-readable violations for one root key
  and returns true when the value is acceptable. Nothing is thrown:
  callers aggregate every violation into a single ValidationFailed.
*/

bool ValidateTwinProperty(const dtdl::InterfaceInfo& model, const std::string& key, const Json& value,
                          std::vector<std::string>& violations);

bool ValidateComponentProperty(const dtdl::InterfaceInfo& component_model, const std::string& component,
                               const std::string& key, const Json& value, std::vector<std::string>& violations);

bool ValidateRelationshipProperty(const dtdl::ContentInfo& relationship, const std::string& key, const Json& value,
                                  std::vector<std::string>& violations);

// $metadata.<key>.lastUpdateTime = timestamp, keeping other per-property fields.
void StampPropertyTime(Json& metadata, const std::string& key, const std::string& timestamp);

} // namespace twingraph::twins
