#include "internal/twins/component_service.hpp"

#include <set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/twins/json_patch.hpp"
#include "internal/twins/property_validation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/etag.hpp"

namespace twingraph::twins {

using observability::StringField;

namespace {

bool IsComponentMetadata(std::string_view key) {
  return key == "$metadata";
}

bool IsEtagCondition(const std::string& if_match) {
  return !if_match.empty() && if_match != "*";
}

std::string PreconditionMessage(const std::string& if_match, const std::string& id) {
  return "If-Match: " + if_match + " header value does not match the current ETag value of the digital twin with id " +
         id;
}

std::string EtagOf(const Json& twin) {
  const auto etag = twin.find("$etag");
  return etag != twin.end() && etag->is_string() ? etag->get<std::string>() : std::string();
}

} // namespace

ComponentService::ComponentService(std::shared_ptr<graph::GraphStore>     store,
                                   std::shared_ptr<models::ModelRegistry> registry, EntityLimits limits,
                                   util::ClockFn clock)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      limits_(limits),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
}

ComponentService::ComponentModel ComponentService::ResolveComponent(const Json& twin, const std::string& component) {
  const auto metadata = twin.value("$metadata", Json::object());
  if (!metadata.is_object() || !metadata.contains("$model") || !metadata["$model"].is_string()) {
    throw util::ValidationFailed("Digital Twin's $metadata must contain a $model property of type string");
  }
  const auto model_id = metadata["$model"].get<std::string>();

  ComponentModel out;
  try {
    out.resolved = registry_->ResolveInterface(model_id);
  } catch (const util::ModelNotFound& e) {
    throw util::ValidationFailed(e.what());
  }

  const auto* content = out.resolved.info->FindContent(component);
  if (content == nullptr || content->kind != dtdl::ContentKind::Component) {
    throw util::ComponentNotFound("Component '" + component + "' is not defined in the model '" + model_id + "'");
  }

  out.schema = out.resolved.Find(content->component_schema);
  if (out.schema == nullptr) {
    throw util::ValidationFailed("Component '" + component + "' does not have a valid interface schema");
  }
  return out;
}

Json ComponentService::Get(const std::string& twin_id, const std::string& component) {
  const auto twin = store_->GetTwin(twin_id);
  if (!twin) {
    throw util::TwinNotFound("Digital Twin with ID " + twin_id + " not found");
  }

  ResolveComponent(*twin, component);

  const auto it = twin->find(component);
  if (it == twin->end() || it->is_null()) {
    throw util::ComponentNotFound("Component '" + component + "' not found on digital twin '" + twin_id + "'");
  }
  return *it;
}

Json ComponentService::Update(const std::string& twin_id, const std::string& component, const Json& patch,
                              const std::string& if_match) {
  Json        stored;
  std::size_t attempts = 0;
  while (!TryUpdate(twin_id, component, patch, if_match, stored)) {
    if (IsEtagCondition(if_match)) {
      throw util::PreconditionFailed(PreconditionMessage(if_match, twin_id));
    }
    if (++attempts >= limits_.max_update_retries) {
      throw util::PreconditionFailed("Digital Twin with ID " + twin_id +
                                     " was modified concurrently; giving up after " + std::to_string(attempts) +
                                     " attempts");
    }
  }
  return stored;
}

bool ComponentService::TryUpdate(const std::string& twin_id, const std::string& component, const Json& patch,
                                 const std::string& if_match, Json& stored) {
  const auto twin = store_->GetTwin(twin_id);
  if (!twin) {
    throw util::TwinNotFound("Digital Twin with ID " + twin_id + " not found");
  }
  const auto etag = EtagOf(*twin);
  if (IsEtagCondition(if_match) && if_match != etag) {
    throw util::PreconditionFailed(PreconditionMessage(if_match, twin_id));
  }

  const auto model = ResolveComponent(*twin, component);

  const auto operations = ParsePatch(patch);
  std::set<std::string> touched;
  for (const auto& operation : operations) {
    if (operation.path.empty() || IsComponentMetadata(operation.Root())) {
      throw util::ValidationFailed("Cannot update '" + operation.pointer + "' of component '" + component + "'");
    }
    touched.insert(operation.Root());
  }

  const auto it      = twin->find(component);
  const Json current = it != twin->end() && it->is_object() ? *it : Json::object();

  Json patched;
  try {
    patched = ApplyPatch(current, operations);
  } catch (const util::ValidationFailed& e) {
    throw util::ValidationFailed("Failed to apply patch to component '" + component + "': " + e.what());
  }
  if (!patched.is_object()) {
    throw util::ValidationFailed("Patched component '" + component + "' is not a valid object");
  }

  std::vector<std::string> violations;
  for (const auto& key : UserKeys(patched, IsComponentMetadata)) {
    ValidateComponentProperty(*model.schema, component, key, patched[key], violations);
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  auto       now       = clock_();
  const auto next_etag = util::NextEtag(twin_id, now, etag);
  const auto stamp     = util::ToIso8601(now);

  Json component_metadata = patched.contains("$metadata") && patched["$metadata"].is_object() ? patched["$metadata"]
                                                                                               : Json::object();
  component_metadata["$lastUpdateTime"] = stamp;
  for (const auto& key : touched) {
    if (patched.contains(key)) {
      StampPropertyTime(component_metadata, key, stamp);
    } else {
      component_metadata.erase(key);
    }
  }
  patched["$metadata"] = std::move(component_metadata);

  const auto twin_metadata = twin->value("$metadata", Json::object());
  Json        entry = twin_metadata.contains(component) && twin_metadata[component].is_object()
                          ? twin_metadata[component]
                          : Json::object();
  entry["lastUpdateTime"] = stamp;

  // Whole objects at each level: the engine's path setter does not create intermediate keys.
  const std::vector<graph::PropertyMutation> mutations = {
      {{component}, patched},
      {{"$metadata", component}, entry},
      {{"$metadata", "$lastUpdateTime"}, Json(stamp)},
      {{"$etag"}, Json(next_etag)},
  };

  const auto result = store_->MutateTwin(twin_id, mutations, etag);
  switch (result.code) {
    case graph::ErrorCode::OK:
      break;
    case graph::ErrorCode::Conflict:
      return false;
    case graph::ErrorCode::NotFound:
      throw util::TwinNotFound("Digital Twin with ID " + twin_id + " not found");
    default:
      throw std::runtime_error("Failed to update component '" + component + "' on digital twin '" + twin_id +
                               "': " + result.message);
  }

  TWINGRAPH_LOG_DEBUG("component updated", {StringField("twin_id", twin_id), StringField("component", component)});
  stored = std::move(patched);
  return true;
}

} // namespace twingraph::twins
