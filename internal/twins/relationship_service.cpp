#include "internal/twins/relationship_service.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/twins/json_patch.hpp"
#include "internal/twins/property_validation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/etag.hpp"

namespace twingraph::twins {

using observability::IntField;
using observability::StringField;

namespace {

std::string StringAt(const Json& object, const char* key) {
  const auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::string EtagKey(const std::string& source_id, const std::string& relationship_id) {
  return source_id + "-" + relationship_id;
}

bool IsEtagCondition(const std::string& if_match) {
  return !if_match.empty() && if_match != "*";
}

std::string PreconditionMessage(const std::string& if_match, const std::string& source_id,
                                const std::string& relationship_id) {
  return "If-Match: " + if_match + " header value does not match the current ETag value of the relationship with id " +
         relationship_id + " on twin with id " + source_id;
}

std::string NotFoundMessage(const std::string& source_id, const std::string& relationship_id) {
  return "Relationship with ID " + relationship_id + " on " + source_id + " not found";
}

// First missing required field of a batch item, empty when complete.
std::string MissingField(const Json& relationship) {
  if (StringAt(relationship, "$sourceId").empty()) return "Source ID ($sourceId) is required";
  if (StringAt(relationship, "$targetId").empty()) return "Target ID ($targetId) is required";
  if (StringAt(relationship, "$relationshipId").empty()) return "Relationship ID ($relationshipId) is required";
  if (StringAt(relationship, "$relationshipName").empty()) return "Relationship name ($relationshipName) is required";
  return {};
}

} // namespace

std::size_t BatchRelationshipResult::SuccessCount() const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(), [](const auto& r) { return r.success; }));
}

std::size_t BatchRelationshipResult::FailureCount() const {
  return results.size() - SuccessCount();
}

RelationshipService::RelationshipService(std::shared_ptr<graph::GraphStore>     store,
                                         std::shared_ptr<models::ModelRegistry> registry, EntityLimits limits,
                                         util::ClockFn clock)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      limits_(limits),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

Json RelationshipService::Get(const std::string& source_id, const std::string& relationship_id) {
  auto relationship = store_->GetRelationship(source_id, relationship_id);
  if (!relationship) {
    throw util::RelationshipNotFound(NotFoundMessage(source_id, relationship_id));
  }
  return std::move(*relationship);
}

std::vector<Json> RelationshipService::List(const std::string&                source_id,
                                            const std::optional<std::string>& relationship_name) {
  return store_->ListRelationships(source_id, relationship_name);
}

std::vector<Json> RelationshipService::ListIncoming(const std::string& target_id) {
  return store_->ListIncomingRelationships(target_id);
}

// ------------------------------------------------------------
// Schema checks
// ------------------------------------------------------------

dtdl::ContentInfo RelationshipService::DeclaredRelationship(const std::string& source_id, const std::string& name) {
  try {
    const auto model_id = registry_->GetTwinModelId(source_id);
    const auto resolved = registry_->ResolveInterface(model_id);
    const auto* content = resolved.info->FindContent(name);
    if (content == nullptr || content->kind != dtdl::ContentKind::Relationship) {
      throw util::ValidationFailed("Relationship '" + name + "' is not defined in the model '" + model_id + "'");
    }
    return *content;
  } catch (const util::ModelNotFound& e) {
    throw util::ValidationFailed(e.what());
  } catch (const util::TwinNotFound&) {
    throw util::ValidationFailed("Source twin '" + source_id + "' does not exist");
  }
}

void RelationshipService::ValidateTarget(const dtdl::ContentInfo& declared, const std::string& target_id,
                                         std::vector<std::string>& violations) {
  if (declared.target.empty()) return;

  try {
    const auto target_model = registry_->GetTwinModelId(target_id);
    if (!registry_->IsOfModel(target_model, declared.target)) {
      violations.push_back("Target twin '" + target_id + "' of model '" + target_model +
                           "' is not a valid target of relationship '" + declared.name + "', expected '" +
                           declared.target + "'");
    }
  } catch (const util::ModelNotFound& e) {
    violations.push_back(e.what());
  } catch (const util::TwinNotFound&) {
    violations.push_back("Target twin '" + target_id + "' does not exist");
  }
}

// ------------------------------------------------------------
// Create / replace
// ------------------------------------------------------------

Json RelationshipService::CreateOrReplace(const std::string& source_id, const std::string& relationship_id,
                                          const Json& relationship, const std::string& if_none_match) {
  if (!relationship.is_object()) {
    throw util::InvalidArgument("Invalid relationship JSON");
  }
  const auto name = StringAt(relationship, "$relationshipName");
  if (name.empty()) {
    throw util::InvalidArgument("Relationship's $relationshipName property is missing");
  }
  const auto target_id = StringAt(relationship, "$targetId");
  if (target_id.empty()) {
    throw util::InvalidArgument("Relationship's $targetId property is missing");
  }
  if (relationship.contains("$sourceId") && StringAt(relationship, "$sourceId") != source_id) {
    throw util::InvalidArgument("Provided $sourceId does not match the digitalTwinId argument");
  }
  if (relationship.contains("$relationshipId") && StringAt(relationship, "$relationshipId") != relationship_id) {
    throw util::InvalidArgument("Provided $relationshipId does not match the relationshipId argument");
  }
  if (!if_none_match.empty() && if_none_match != "*") {
    throw util::InvalidArgument("Invalid If-None-Match header value. Allowed value(s): If-None-Match: *");
  }
  if (if_none_match == "*" && store_->GetRelationship(source_id, relationship_id)) {
    throw util::PreconditionFailed("If-None-Match: * header was specified but a relationship with the id " +
                                   relationship_id + " on twin with id " + source_id +
                                   " was found. Please specify a different twin and relationship id.");
  }

  const auto existing = store_->FindExistingTwins({source_id, target_id});
  auto       exists   = [&](const std::string& id) {
    return std::find(existing.begin(), existing.end(), id) != existing.end();
  };
  std::vector<std::string> violations;
  if (!exists(source_id)) violations.push_back("Source twin '" + source_id + "' does not exist");
  if (!exists(target_id)) violations.push_back("Target twin '" + target_id + "' does not exist");
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  const auto declared = DeclaredRelationship(source_id, name);
  ValidateTarget(declared, target_id, violations);
  for (const auto& key : UserKeys(relationship, IsReservedRelationshipKey)) {
    ValidateRelationshipProperty(declared, key, relationship[key], violations);
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  Json stored               = relationship;
  stored["$sourceId"]       = source_id;
  stored["$relationshipId"] = relationship_id;
  stored["$etag"]           = util::GenerateEtag(EtagKey(source_id, relationship_id), clock_());

  const auto result = store_->UpsertRelationship(stored);
  switch (result.code) {
    case graph::ErrorCode::OK:
      break;
    case graph::ErrorCode::NotFound:
      throw util::ValidationFailed("Source twin '" + source_id + "' or target twin '" + target_id +
                                   "' no longer exists");
    default:
      throw std::runtime_error("Failed to write relationship " + relationship_id + ": " + result.message);
  }

  TWINGRAPH_LOG_DEBUG("relationship written", {StringField("source_id", source_id),
                                               StringField("relationship_id", relationship_id),
                                               StringField("relationship_name", name)});
  return stored;
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

Json RelationshipService::Update(const std::string& source_id, const std::string& relationship_id, const Json& patch,
                                 const std::string& if_match) {
  Json        stored;
  std::size_t attempts = 0;
  while (!TryUpdate(source_id, relationship_id, patch, if_match, stored)) {
    if (IsEtagCondition(if_match)) {
      throw util::PreconditionFailed(PreconditionMessage(if_match, source_id, relationship_id));
    }
    if (++attempts >= limits_.max_update_retries) {
      throw util::PreconditionFailed("Relationship with ID " + relationship_id + " on " + source_id +
                                     " was modified concurrently; giving up after " + std::to_string(attempts) +
                                     " attempts");
    }
  }
  return stored;
}

bool RelationshipService::TryUpdate(const std::string& source_id, const std::string& relationship_id,
                                    const Json& patch, const std::string& if_match, Json& stored) {
  const auto current = Get(source_id, relationship_id);
  const auto etag    = StringAt(current, "$etag");
  if (IsEtagCondition(if_match) && if_match != etag) {
    throw util::PreconditionFailed(PreconditionMessage(if_match, source_id, relationship_id));
  }

  const auto operations = ParsePatch(patch);

  std::vector<std::string> violations;
  std::set<std::string>    touched;
  for (const auto& operation : operations) {
    if (operation.path.empty()) {
      violations.push_back("Cannot replace the whole relationship");
    } else if (IsReservedRelationshipKey(operation.Root())) {
      violations.push_back("Cannot update the " + operation.Root() + " property");
    } else {
      touched.insert(operation.Root());
    }
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  Json updated = ApplyPatch(current, operations);
  if (!updated.is_object()) {
    throw util::ValidationFailed("Patched relationship is not a valid object");
  }

  const auto declared = DeclaredRelationship(source_id, StringAt(current, "$relationshipName"));
  for (const auto& key : touched) {
    if (updated.contains(key)) ValidateRelationshipProperty(declared, key, updated[key], violations);
  }
  if (!violations.empty()) {
    throw util::ValidationFailed(std::move(violations));
  }

  auto now        = clock_();
  updated["$etag"] = util::NextEtag(EtagKey(source_id, relationship_id), now, etag);

  const auto result = store_->ReplaceRelationshipIfMatch(updated, etag);
  switch (result.code) {
    case graph::ErrorCode::OK:
      stored = std::move(updated);
      return true;
    case graph::ErrorCode::Conflict:
      return false;
    case graph::ErrorCode::NotFound:
      throw util::RelationshipNotFound(NotFoundMessage(source_id, relationship_id));
    default:
      throw std::runtime_error("Failed to update relationship " + relationship_id + ": " + result.message);
  }
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void RelationshipService::Delete(const std::string& source_id, const std::string& relationship_id) {
  const auto result = store_->DeleteRelationship(source_id, relationship_id);
  if (result.code == graph::ErrorCode::NotFound) {
    throw util::RelationshipNotFound(NotFoundMessage(source_id, relationship_id));
  }
  if (!result) {
    throw std::runtime_error("Failed to delete relationship " + relationship_id + ": " + result.message);
  }
}

// ------------------------------------------------------------
// Batch
// ------------------------------------------------------------

BatchRelationshipResult RelationshipService::CreateOrReplaceMany(const std::vector<Json>& relationships) {
  if (relationships.empty()) {
    throw util::InvalidArgument("Relationships cannot be empty");
  }
  if (relationships.size() > limits_.max_batch_relationships) {
    throw util::InvalidArgument("Cannot process more than " + std::to_string(limits_.max_batch_relationships) +
                                " relationships in a single batch");
  }

  BatchRelationshipResult batch;
  batch.results.resize(relationships.size());

  // Phase 1: per-item shape.
  std::vector<bool>        pending(relationships.size(), false);
  std::vector<std::string> endpoint_ids;
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    const auto& item   = relationships[i];
    auto&       result = batch.results[i];
    if (!item.is_object()) {
      result.error = "Relationship must be a JSON object";
      continue;
    }
    result.source_id       = StringAt(item, "$sourceId");
    result.relationship_id = StringAt(item, "$relationshipId");

    result.error = MissingField(item);
    if (!result.error.empty()) continue;

    pending[i] = true;
    endpoint_ids.push_back(result.source_id);
    endpoint_ids.push_back(StringAt(item, "$targetId"));
  }

  // Phase 2: one existence lookup for every endpoint.
  std::set<std::string> existing;
  if (!endpoint_ids.empty()) {
    std::sort(endpoint_ids.begin(), endpoint_ids.end());
    endpoint_ids.erase(std::unique(endpoint_ids.begin(), endpoint_ids.end()), endpoint_ids.end());
    const auto found = store_->FindExistingTwins(endpoint_ids);
    existing.insert(found.begin(), found.end());
  }

  std::map<std::string, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    if (!pending[i]) continue;
    auto&      result    = batch.results[i];
    const auto target_id = StringAt(relationships[i], "$targetId");
    if (existing.count(result.source_id) == 0) {
      result.error = "Source twin '" + result.source_id + "' does not exist";
    } else if (existing.count(target_id) == 0) {
      result.error = "Target twin '" + target_id + "' does not exist";
    } else {
      groups[StringAt(relationships[i], "$relationshipName")].push_back(i);
    }
  }

  // Phase 3: one write per relationship name.
  const auto now = clock_();
  for (const auto& [name, indexes] : groups) {
    std::vector<Json> items;
    items.reserve(indexes.size());
    for (auto i : indexes) {
      Json item     = relationships[i];
      item["$etag"] = util::GenerateEtag(
          EtagKey(batch.results[i].source_id, batch.results[i].relationship_id), now);
      items.push_back(std::move(item));
    }

    std::string              error;
    std::vector<std::size_t> unwritten;
    try {
      const auto result = store_->UpsertRelationships(name, items, unwritten);
      if (!result) error = "Database operation failed: " + result.message;
    } catch (const std::exception& e) {
      error = std::string("Database operation failed: ") + e.what();
    }

    if (!error.empty()) {
      TWINGRAPH_LOG_WARN("relationship batch group failed",
                         {StringField("relationship_name", name), StringField("error", error)});
    }
    for (auto i : indexes) {
      batch.results[i].success = error.empty();
      batch.results[i].error   = error;
    }
    if (!error.empty()) continue;

    // endpoints deleted between the existence check and the write
    for (auto position : unwritten) {
      if (position >= indexes.size()) continue;
      auto& result   = batch.results[indexes[position]];
      result.success = false;
      result.error   = "Source twin '" + result.source_id + "' or target twin '" +
                     StringAt(relationships[indexes[position]], "$targetId") + "' no longer exists";
    }
  }

  TWINGRAPH_LOG_INFO("relationship batch processed",
                     {IntField("items", static_cast<std::int64_t>(relationships.size())),
                      IntField("succeeded", static_cast<std::int64_t>(batch.SuccessCount())),
                      IntField("failed", static_cast<std::int64_t>(batch.FailureCount()))});
  return batch;
}

} // namespace twingraph::twins
