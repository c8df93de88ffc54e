#include "internal/models/model_data.hpp"

#include "internal/util/errors.hpp"

namespace twingraph::models {
namespace {

Json LanguageMap(const Json& value) {
  if (value.is_string()) return Json{{"en", value}};
  if (value.is_object()) return value;
  return Json::object();
}

} // namespace

Json ModelData::ToJson() const {
  Json out = Json::object();
  out["id"] = id;
  if (model) out["model"] = *model;
  out["uploadTime"]     = upload_time;
  out["displayName"]    = display_name;
  out["description"]    = description;
  out["decommissioned"] = decommissioned;
  out["bases"]          = bases;
  return out;
}

ModelData ModelData::FromJson(const Json& stored) {
  if (!stored.is_object() || !stored.contains("id") || !stored["id"].is_string()) {
    throw util::InvalidArgument("Model data must contain an 'id' property.");
  }

  ModelData data;
  data.id = stored["id"].get<std::string>();
  if (stored.contains("model") && !stored["model"].is_null()) data.model = stored["model"];
  if (stored.contains("uploadTime") && stored["uploadTime"].is_string()) {
    data.upload_time = stored["uploadTime"].get<std::string>();
  }
  if (stored.contains("displayName")) data.display_name = LanguageMap(stored["displayName"]);
  if (stored.contains("description")) data.description = LanguageMap(stored["description"]);
  if (stored.contains("decommissioned") && stored["decommissioned"].is_boolean()) {
    data.decommissioned = stored["decommissioned"].get<bool>();
  }
  if (stored.contains("bases") && stored["bases"].is_array()) {
    for (const auto& base : stored["bases"]) {
      if (base.is_string()) data.bases.push_back(base.get<std::string>());
    }
  }
  return data;
}

ModelData ModelData::FromDefinition(const Json& definition, std::string upload_time) {
  ModelData data;
  data.id          = definition.value("@id", std::string());
  data.model       = definition;
  data.upload_time = std::move(upload_time);
  if (definition.contains("displayName")) data.display_name = LanguageMap(definition["displayName"]);
  if (definition.contains("description")) data.description = LanguageMap(definition["description"]);
  return data;
}

} // namespace twingraph::models
