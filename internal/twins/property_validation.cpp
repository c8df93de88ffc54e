#include "internal/twins/property_validation.hpp"

namespace twingraph::twins {

namespace {

bool AppendPrefixed(std::vector<std::string>& violations, const std::string& prefix,
                    const std::vector<std::string>& failures) {
  for (const auto& failure : failures) {
    violations.push_back(prefix + failure);
  }
  return failures.empty();
}

std::vector<std::string> Check(const dtdl::SchemaPtr& schema, const Json& value) {
  return schema ? schema->ValidateInstance(value) : std::vector<std::string>{};
}

} // namespace

bool IsReservedTwinKey(std::string_view key) {
  return key == "$dtId" || key == "$etag" || key == "$metadata";
}

bool IsReservedRelationshipKey(std::string_view key) {
  return key == "$relationshipId" || key == "$sourceId" || key == "$targetId" || key == "$relationshipName" ||
         key == "$etag";
}

std::vector<std::string> UserKeys(const Json& object, bool (*reserved)(std::string_view)) {
  std::vector<std::string> keys;
  if (!object.is_object()) return keys;
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (!reserved(it.key())) keys.push_back(it.key());
  }
  return keys;
}

bool ValidateTwinProperty(const dtdl::InterfaceInfo& model, const std::string& key, const Json& value,
                          std::vector<std::string>& violations) {
  const auto* content = model.FindContent(key);
  if (content == nullptr) {
    violations.push_back("Property '" + key + "' is not defined in the model");
    return false;
  }

  if (content->kind != dtdl::ContentKind::Property) {
    violations.push_back("Property '" + key + "' is a " + std::string(dtdl::ToString(content->kind)) +
                         " and is not supported");
    return false;
  }

  return AppendPrefixed(violations, "Property '" + key + "': ", Check(content->schema, value));
}

bool ValidateComponentProperty(const dtdl::InterfaceInfo& component_model, const std::string& component,
                               const std::string& key, const Json& value, std::vector<std::string>& violations) {
  const auto* content = component_model.FindContent(key);
  if (content == nullptr || content->kind != dtdl::ContentKind::Property) {
    violations.push_back("Property '" + key + "' is not defined in component '" + component + "' schema");
    return false;
  }

  return AppendPrefixed(violations, "Component '" + component + "' property '" + key + "': ",
                        Check(content->schema, value));
}

bool ValidateRelationshipProperty(const dtdl::ContentInfo& relationship, const std::string& key, const Json& value,
                                  std::vector<std::string>& violations) {
  for (const auto& property : relationship.properties) {
    if (property.name != key) continue;
    return AppendPrefixed(violations, "Relationship property '" + key + "': ",
                          Check(property.schema, value));
  }

  violations.push_back("Property '" + key + "' is not defined in relationship '" + relationship.name + "'");
  return false;
}

void StampPropertyTime(Json& metadata, const std::string& key, const std::string& timestamp) {
  auto& entry = metadata[key];
  if (!entry.is_object()) entry = Json::object();
  entry["lastUpdateTime"] = timestamp;
}

} // namespace twingraph::twins
