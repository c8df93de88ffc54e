#include "internal/twins/digital_twin_service.hpp"

#include <set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/twins/json_patch.hpp"
#include "internal/twins/property_validation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/etag.hpp"

namespace twingraph::twins {

using observability::IntField;
using observability::StringField;

namespace {

std::string ModelOf(const Json& twin) {
  const auto metadata = twin.find("$metadata");
  if (metadata == twin.end() || !metadata->is_object()) return {};
  const auto model = metadata->find("$model");
  if (model == metadata->end() || !model->is_string()) return {};
  return model->get<std::string>();
}

std::string EtagOf(const Json& twin) {
  const auto etag = twin.find("$etag");
  return etag != twin.end() && etag->is_string() ? etag->get<std::string>() : std::string();
}

bool IsEtagCondition(const std::string& if_match) {
  return !if_match.empty() && if_match != "*";
}

std::string PreconditionMessage(const std::string& if_match, const std::string& id) {
  return "If-Match: " + if_match + " header value does not match the current ETag value of the digital twin with id " +
         id;
}

} // namespace

DigitalTwinService::DigitalTwinService(std::shared_ptr<graph::GraphStore>     store,
                                       std::shared_ptr<models::ModelRegistry> registry, EntityLimits limits,
                                       util::ClockFn clock)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      limits_(limits),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
}

// Model problems while writing a twin are the twin's fault, not a missing resource.
models::ResolvedInterface DigitalTwinService::ResolveModel(const std::string& model_id) {
  try {
    return registry_->ResolveInterface(model_id);
  } catch (const util::ModelNotFound& e) {
    throw util::ValidationFailed(e.what());
  }
}

bool DigitalTwinService::Exists(const std::string& id) {
  return store_->GetTwin(id).has_value();
}

Json DigitalTwinService::Get(const std::string& id) {
  auto twin = store_->GetTwin(id);
  if (!twin) {
    throw util::TwinNotFound("Digital Twin with ID " + id + " not found");
  }
  return std::move(*twin);
}

// ------------------------------------------------------------
// Create / replace
// ------------------------------------------------------------

Json DigitalTwinService::CreateOrReplace(const std::string& id, const Json& twin, const std::string& if_none_match) {
  if (!twin.is_object()) {
    throw util::InvalidArgument("Digital Twin must be a JSON object");
  }
  if (!twin.contains("$metadata") || !twin["$metadata"].is_object()) {
    throw util::InvalidArgument("Digital Twin must have a $metadata property of type object");
  }
  const auto model_id = ModelOf(twin);
  if (model_id.empty()) {
    throw util::InvalidArgument("Digital Twin's $metadata must contain a $model property of type string");
  }
  if (twin.contains("$dtId") && (!twin["$dtId"].is_string() || twin["$dtId"].get<std::string>() != id)) {
    throw util::InvalidArgument("Provided digitalTwinId does not match the $dtId property");
  }
  if (!if_none_match.empty() && if_none_match != "*") {
    throw util::InvalidArgument("Invalid If-None-Match header value. Allowed value(s): If-None-Match: *");
  }
  if (if_none_match == "*" && Exists(id)) {
    throw util::PreconditionFailed("If-None-Match: * header was specified but a twin with the id " + id +
                                   " was found. Please specify a different twin id.");
  }

  const auto resolved = ResolveModel(model_id);
  auto       now      = clock_();
  const auto stamp    = util::ToIso8601(now);

  Json                     stored = twin;
  auto&                    metadata = stored["$metadata"];
  std::vector<std::string> violations;
  for (const auto& key : UserKeys(stored, IsReservedTwinKey)) {
    if (ValidateTwinProperty(*resolved.info, key, stored[key], violations)) {
      StampPropertyTime(metadata, key, stamp);
    }
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  metadata["$lastUpdateTime"] = stamp;
  stored["$dtId"]             = id;
  stored["$etag"]             = util::GenerateEtag(id, now);

  const auto result = store_->UpsertTwin(stored);
  if (!result) {
    throw std::runtime_error("Failed to write digital twin " + id + ": " + result.message);
  }

  registry_->RememberTwinModel(id, model_id);
  TWINGRAPH_LOG_DEBUG("twin written", {StringField("twin_id", id), StringField("model_id", model_id)});
  return stored;
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

Json DigitalTwinService::Update(const std::string& id, const Json& patch, const std::string& if_match) {
  Json        stored;
  std::size_t attempts = 0;
  while (!TryUpdate(id, patch, if_match, stored)) {
    if (IsEtagCondition(if_match)) {
      throw util::PreconditionFailed(PreconditionMessage(if_match, id));
    }
    if (++attempts >= limits_.max_update_retries) {
      throw util::PreconditionFailed("Digital Twin with ID " + id + " was modified concurrently; giving up after " +
                                     std::to_string(attempts) + " attempts");
    }
    TWINGRAPH_LOG_DEBUG("twin update retried", {StringField("twin_id", id), IntField("attempt", attempts)});
  }
  return stored;
}

bool DigitalTwinService::TryUpdate(const std::string& id, const Json& patch, const std::string& if_match,
                                   Json& stored) {
  const auto current = Get(id);
  const auto etag    = EtagOf(current);
  if (IsEtagCondition(if_match) && if_match != etag) {
    throw util::PreconditionFailed(PreconditionMessage(if_match, id));
  }

  const auto operations = ParsePatch(patch);

  std::vector<std::string> violations;
  std::set<std::string>    touched;
  for (const auto& operation : operations) {
    const auto& root = operation.Root();
    if (operation.path.empty()) {
      violations.push_back("Cannot replace the whole digital twin");
    } else if (root == "$dtId") {
      violations.push_back("Cannot update the $dtId property");
    } else if (root == "$etag") {
      violations.push_back("Cannot update the $etag property");
    } else if (root == "$metadata") {
      if (operation.path.size() != 2 || operation.path[1] != "$model" || operation.op == PatchOp::Remove) {
        violations.push_back("Cannot update the metadata property '" + operation.pointer + "'");
      }
    } else {
      touched.insert(root);
    }
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  Json updated = ApplyPatch(current, operations);

  const auto model_id = ModelOf(updated);
  if (model_id.empty()) {
    throw util::ValidationFailed("Digital Twin's $metadata must contain a $model property of type string");
  }
  const bool model_changed = model_id != ModelOf(current);
  const auto resolved      = ResolveModel(model_id);

  auto       now   = clock_();
  const auto stamp = util::ToIso8601(now);
  auto&      metadata = updated["$metadata"];

  // A model change puts every property under the new schema; otherwise only what the patch touched.
  auto keys = model_changed ? UserKeys(updated, IsReservedTwinKey)
                            : std::vector<std::string>(touched.begin(), touched.end());
  if (model_changed) {
    // removed roots are no longer in the twin but still own a metadata entry
    for (const auto& key : touched) {
      if (!updated.contains(key)) keys.push_back(key);
    }
  }
  for (const auto& key : keys) {
    if (!updated.contains(key)) {
      metadata.erase(key);
      continue;
    }
    if (ValidateTwinProperty(*resolved.info, key, updated[key], violations) && touched.count(key) > 0) {
      StampPropertyTime(metadata, key, stamp);
    }
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  const auto next_etag        = util::NextEtag(id, now, etag);
  metadata["$lastUpdateTime"] = util::ToIso8601(now);
  updated["$etag"]            = next_etag;

  const auto result = store_->ReplaceTwinIfMatch(updated, etag);
  switch (result.code) {
    case graph::ErrorCode::OK:
      break;
    case graph::ErrorCode::Conflict:
      return false;
    case graph::ErrorCode::NotFound:
      throw util::TwinNotFound("Digital Twin with ID " + id + " not found");
    default:
      throw std::runtime_error("Failed to update digital twin " + id + ": " + result.message);
  }

  if (model_changed) registry_->RememberTwinModel(id, model_id);
  stored = std::move(updated);
  return true;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void DigitalTwinService::Delete(const std::string& id) {
  const auto result = store_->DeleteTwin(id);
  switch (result.code) {
    case graph::ErrorCode::OK:
      break;
    case graph::ErrorCode::NotFound:
      throw util::TwinNotFound("Digital Twin with ID " + id + " not found");
    case graph::ErrorCode::ConstraintViolation:
      throw util::ReferentialIntegrityError("Digital Twin with ID " + id +
                                            " still has relationships and cannot be deleted");
    default:
      throw std::runtime_error("Failed to delete digital twin " + id + ": " + result.message);
  }

  registry_->ForgetTwin(id);
  TWINGRAPH_LOG_DEBUG("twin deleted", {StringField("twin_id", id)});
}

} // namespace twingraph::twins
