#include "internal/graph/memory/memory_graph_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace twingraph::graph::memory {

namespace {

std::string StringAt(const Json& object, const char* key) {
  if (!object.is_object()) return {};
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

bool EtagMatches(const Json& stored, const std::string& expected) {
  return StringAt(stored, "$etag") == expected;
}

} // namespace

MemoryGraphStore::MemoryGraphStore() = default;

MemoryGraphStore::EdgeKey MemoryGraphStore::KeyOf(const Json& relationship) {
  return {StringAt(relationship, "$sourceId"), StringAt(relationship, "$relationshipId")};
}

bool MemoryGraphStore::EndpointsExist(const Json& relationship) const {
  return state_.twins.count(StringAt(relationship, "$sourceId")) > 0 &&
         state_.twins.count(StringAt(relationship, "$targetId")) > 0;
}

QueryRows MemoryGraphStore::Execute(const std::string& cypher, SessionRole) {
  throw util::Unsupported("The in-memory graph store cannot execute Cypher: " + cypher);
}

// ------------------------------------------------------------
// Twins
// ------------------------------------------------------------

std::optional<Json> MemoryGraphStore::GetTwin(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.twins.find(id);
  if (it == state_.twins.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryGraphStore::FindExistingTwins(const std::vector<std::string>& ids) {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> found;
  for (const auto& id : ids) {
    if (state_.twins.count(id) > 0 && std::find(found.begin(), found.end(), id) == found.end()) {
      found.push_back(id);
    }
  }
  return found;
}

Result MemoryGraphStore::UpsertTwin(const Json& twin) {
  const auto id = StringAt(twin, "$dtId");
  if (id.empty()) return Result::Err(ErrorCode::InternalError, "twin has no $dtId");

  std::lock_guard lock(mutex_);
  state_.twins[id] = twin;
  return Result::Ok();
}

Result MemoryGraphStore::ReplaceTwinIfMatch(const Json& twin, const std::string& expected_etag) {
  const auto id = StringAt(twin, "$dtId");

  std::lock_guard lock(mutex_);
  auto            it = state_.twins.find(id);
  if (it == state_.twins.end()) return Result::Err(ErrorCode::NotFound, id);
  if (!EtagMatches(it->second, expected_etag)) return Result::Err(ErrorCode::Conflict, id);
  it->second = twin;
  return Result::Ok();
}

Result MemoryGraphStore::MutateTwin(const std::string& id, const std::vector<PropertyMutation>& mutations,
                                    const std::string& expected_etag) {
  std::lock_guard lock(mutex_);
  auto            it = state_.twins.find(id);
  if (it == state_.twins.end()) return Result::Err(ErrorCode::NotFound, id);
  if (!EtagMatches(it->second, expected_etag)) return Result::Err(ErrorCode::Conflict, id);

  Json updated = it->second;
  for (const auto& mutation : mutations) {
    if (mutation.path.empty()) return Result::Err(ErrorCode::InternalError, "empty mutation path");

    Json* node = &updated;
    for (std::size_t i = 0; i + 1 < mutation.path.size(); ++i) {
      if (!node->is_object()) {
        return Result::Err(ErrorCode::InternalError, "mutation path crosses a non-object at '" + mutation.path[i] + "'");
      }
      if (!mutation.value && !node->contains(mutation.path[i])) {
        node = nullptr;
        break;
      }
      node = &(*node)[mutation.path[i]];
      if (node->is_null()) *node = Json::object();
    }
    if (node == nullptr) continue;
    if (!node->is_object()) {
      return Result::Err(ErrorCode::InternalError, "mutation target is not an object");
    }

    if (mutation.value) {
      (*node)[mutation.path.back()] = *mutation.value;
    } else {
      node->erase(mutation.path.back());
    }
  }

  it->second = std::move(updated);
  return Result::Ok();
}

Result MemoryGraphStore::DeleteTwin(const std::string& id) {
  std::lock_guard lock(mutex_);
  if (state_.twins.count(id) == 0) return Result::Err(ErrorCode::NotFound, id);

  for (const auto& [_, relationship] : state_.relationships) {
    if (StringAt(relationship, "$sourceId") == id || StringAt(relationship, "$targetId") == id) {
      return Result::Err(ErrorCode::ConstraintViolation, "Cannot delete vertex '" + id + "', because it still has edges");
    }
  }

  state_.twins.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Relationships
// ------------------------------------------------------------

std::optional<Json> MemoryGraphStore::GetRelationship(const std::string& source_id,
                                                      const std::string& relationship_id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.relationships.find({source_id, relationship_id});
  if (it == state_.relationships.end()) return std::nullopt;
  return it->second;
}

std::vector<Json> MemoryGraphStore::ListRelationships(const std::string&                source_id,
                                                      const std::optional<std::string>& relationship_name) {
  std::lock_guard   lock(mutex_);
  std::vector<Json> out;
  for (const auto& [key, relationship] : state_.relationships) {
    if (key.first != source_id) continue;
    if (relationship_name && StringAt(relationship, "$relationshipName") != *relationship_name) continue;
    out.push_back(relationship);
  }
  return out;
}

std::vector<Json> MemoryGraphStore::ListIncomingRelationships(const std::string& target_id) {
  std::lock_guard   lock(mutex_);
  std::vector<Json> out;
  for (const auto& [_, relationship] : state_.relationships) {
    if (StringAt(relationship, "$targetId") == target_id) out.push_back(relationship);
  }
  return out;
}

Result MemoryGraphStore::UpsertRelationship(const Json& relationship) {
  std::lock_guard lock(mutex_);
  if (!EndpointsExist(relationship)) {
    return Result::Err(ErrorCode::NotFound, "source or target twin does not exist");
  }
  state_.relationships[KeyOf(relationship)] = relationship;
  return Result::Ok();
}

Result MemoryGraphStore::UpsertRelationships(const std::string&       relationship_name,
                                             const std::vector<Json>& relationships,
                                             std::vector<std::size_t>& unwritten) {
  std::lock_guard lock(mutex_);
  for (const auto& relationship : relationships) {
    if (StringAt(relationship, "$relationshipName") != relationship_name) {
      return Result::Err(ErrorCode::InternalError, "relationship does not belong to group " + relationship_name);
    }
  }
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    if (!EndpointsExist(relationships[i])) {
      unwritten.push_back(i);
      continue;
    }
    state_.relationships[KeyOf(relationships[i])] = relationships[i];
  }
  return Result::Ok();
}

Result MemoryGraphStore::ReplaceRelationshipIfMatch(const Json& relationship, const std::string& expected_etag) {
  std::lock_guard lock(mutex_);
  auto            it = state_.relationships.find(KeyOf(relationship));
  if (it == state_.relationships.end()) return Result::Err(ErrorCode::NotFound);
  if (!EtagMatches(it->second, expected_etag)) return Result::Err(ErrorCode::Conflict);
  it->second = relationship;
  return Result::Ok();
}

Result MemoryGraphStore::DeleteRelationship(const std::string& source_id, const std::string& relationship_id) {
  std::lock_guard lock(mutex_);
  if (state_.relationships.erase({source_id, relationship_id}) == 0) {
    return Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

// ------------------------------------------------------------
// Models
// ------------------------------------------------------------

Result MemoryGraphStore::InsertModels(const std::vector<Json>& models) {
  std::lock_guard       lock(mutex_);
  std::set<std::string> batch;
  for (const auto& model : models) {
    const auto id = StringAt(model, "id");
    if (id.empty()) return Result::Err(ErrorCode::InternalError, "model has no id");
    if (state_.models.count(id) > 0 || !batch.insert(id).second) {
      return Result::Err(ErrorCode::AlreadyExists, "Model with id " + id + " already exists");
    }
  }
  for (const auto& model : models) {
    state_.models[StringAt(model, "id")] = model;
  }
  return Result::Ok();
}

std::optional<Json> MemoryGraphStore::GetModel(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.models.find(id);
  if (it == state_.models.end()) return std::nullopt;
  return it->second;
}

std::vector<Json> MemoryGraphStore::ListModels(const std::vector<std::string>& dependencies_for) {
  std::lock_guard   lock(mutex_);
  std::vector<Json> out;

  if (dependencies_for.empty()) {
    for (const auto& [_, model] : state_.models) out.push_back(model);
    return out;
  }

  std::set<std::string> seen;
  auto                  add = [&](const std::string& id) {
    auto it = state_.models.find(id);
    if (it != state_.models.end() && seen.insert(id).second) out.push_back(it->second);
  };

  for (const auto& id : dependencies_for) add(id);
  for (const auto& id : dependencies_for) {
    auto it = state_.models.find(id);
    if (it == state_.models.end() || !it->second.contains("bases")) continue;
    for (const auto& base : it->second["bases"]) {
      if (base.is_string()) add(base.get<std::string>());
    }
  }
  return out;
}

Result MemoryGraphStore::AddModelEdge(const std::string& from_id, const std::string& to_id, const std::string& label) {
  std::lock_guard lock(mutex_);
  if (state_.models.count(from_id) == 0 || state_.models.count(to_id) == 0) {
    return Result::Err(ErrorCode::NotFound, from_id + " -> " + to_id);
  }
  state_.model_edges.push_back({from_id, to_id, label});
  return Result::Ok();
}

Result MemoryGraphStore::EnsureEdgeLabel(const std::string& label) {
  std::lock_guard lock(mutex_);
  state_.edge_labels.insert(label);
  return Result::Ok();
}

Result MemoryGraphStore::DeleteModel(const std::string& id) {
  std::lock_guard lock(mutex_);
  if (state_.models.count(id) == 0) return Result::Err(ErrorCode::NotFound, id);

  for (const auto& edge : state_.model_edges) {
    if (edge.to == id && edge.from != id) {
      return Result::Err(ErrorCode::ConstraintViolation, "Model " + id + " is referenced by " + edge.from);
    }
  }

  auto& edges = state_.model_edges;
  edges.erase(std::remove_if(edges.begin(), edges.end(), [&](const ModelEdge& e) { return e.from == id; }),
              edges.end());
  state_.models.erase(id);
  return Result::Ok();
}

Result MemoryGraphStore::DeleteAllModels() {
  std::lock_guard lock(mutex_);
  if (state_.models.empty()) return Result::Err(ErrorCode::NotFound, "No models found");
  state_.models.clear();
  state_.model_edges.clear();
  return Result::Ok();
}

bool MemoryGraphStore::HasEdgeLabel(const std::string& label) const {
  std::lock_guard lock(mutex_);
  return state_.edge_labels.count(label) > 0;
}

std::size_t MemoryGraphStore::ModelEdgeCount(const std::string& label) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(std::count_if(state_.model_edges.begin(), state_.model_edges.end(),
                                                [&](const ModelEdge& e) { return e.label == label; }));
}

} // namespace twingraph::graph::memory
