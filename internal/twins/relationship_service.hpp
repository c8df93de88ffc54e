#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/twins/limits.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace twingraph::twins {

using util::Json;

struct RelationshipOperationResult {
  std::string source_id;
  std::string relationship_id;
  bool        success = false;
  std::string error;
};

// One result per submitted item, in submission order.
struct BatchRelationshipResult {
  std::vector<RelationshipOperationResult> results;

  std::size_t SuccessCount() const;
  std::size_t FailureCount() const;
};

/*
  RelationshipService

  Relationships are edges labeled with their relationship name and
  addressed by (source twin id, relationship id).

  Single-item writes validate against the relationship declared on the
  source twin's model: the name must be declared, the target twin must
  be of the declared target model, and user properties must match the
  declared relationship properties.

  CreateOrReplaceMany validates fields and endpoints only and writes
  one statement per relationship name. A failed group does not roll
  back the others.
*/
class RelationshipService {
 public:
  RelationshipService(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<models::ModelRegistry> registry,
                      EntityLimits limits = {}, util::ClockFn clock = util::Now);

  Json Get(const std::string& source_id, const std::string& relationship_id);

  std::vector<Json> List(const std::string& source_id, const std::optional<std::string>& relationship_name = {});

  std::vector<Json> ListIncoming(const std::string& target_id);

  Json CreateOrReplace(const std::string& source_id, const std::string& relationship_id, const Json& relationship,
                       const std::string& if_none_match = {});

  Json Update(const std::string& source_id, const std::string& relationship_id, const Json& patch,
              const std::string& if_match = {});

  void Delete(const std::string& source_id, const std::string& relationship_id);

  BatchRelationshipResult CreateOrReplaceMany(const std::vector<Json>& relationships);

 private:
  // Declared relationship content on the source twin's model; throws ValidationFailed when absent.
  dtdl::ContentInfo DeclaredRelationship(const std::string& source_id, const std::string& name);

  void ValidateTarget(const dtdl::ContentInfo& declared, const std::string& target_id,
                      std::vector<std::string>& violations);

  bool TryUpdate(const std::string& source_id, const std::string& relationship_id, const Json& patch,
                 const std::string& if_match, Json& stored);

  std::shared_ptr<graph::GraphStore>     store_;
  std::shared_ptr<models::ModelRegistry> registry_;
  EntityLimits                           limits_;
  util::ClockFn                          clock_;
};

} // namespace twingraph::twins
