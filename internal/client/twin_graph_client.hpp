#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/client/service_context.hpp"
#include "internal/models/model_data.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/query/query_service.hpp"
#include "internal/twins/relationship_service.hpp"
#include "internal/util/json.hpp"

namespace twingraph::client {

using util::Json;

/*
  TwinGraphClient

  Single entry point over the query, model, twin, relationship and
  component services. Every call is observed: failures are logged
  with the operation name and rethrown unchanged.
*/
class TwinGraphClient {
 public:
  explicit TwinGraphClient(ServiceContext ctx);

  // Query
  query::QueryPage Query(const std::string& query, const query::QueryOptions& options = {}) const;

  // Models
  std::vector<models::ModelData> CreateModels(const std::vector<std::string>& definitions) const;
  models::ModelData              GetModel(const std::string& id) const;
  std::vector<models::ModelData> GetModels(const models::GetModelsOptions& options = {}) const;
  void                           DeleteModel(const std::string& id) const;
  void                           DeleteAllModels() const;

  // Digital twins
  bool DigitalTwinExists(const std::string& id) const;
  Json GetDigitalTwin(const std::string& id) const;
  Json CreateOrReplaceDigitalTwin(const std::string& id, const Json& twin, const std::string& if_none_match = {}) const;
  Json UpdateDigitalTwin(const std::string& id, const Json& patch, const std::string& if_match = {}) const;
  void DeleteDigitalTwin(const std::string& id) const;

  // Relationships
  Json              GetRelationship(const std::string& source_id, const std::string& relationship_id) const;
  std::vector<Json> GetRelationships(const std::string&                source_id,
                                     const std::optional<std::string>& relationship_name = {}) const;
  std::vector<Json> GetIncomingRelationships(const std::string& target_id) const;
  Json CreateOrReplaceRelationship(const std::string& source_id, const std::string& relationship_id,
                                   const Json& relationship, const std::string& if_none_match = {}) const;
  Json UpdateRelationship(const std::string& source_id, const std::string& relationship_id, const Json& patch,
                          const std::string& if_match = {}) const;
  void DeleteRelationship(const std::string& source_id, const std::string& relationship_id) const;
  twins::BatchRelationshipResult CreateOrReplaceRelationships(const std::vector<Json>& relationships) const;

  // Components
  Json GetComponent(const std::string& twin_id, const std::string& component) const;
  Json UpdateComponent(const std::string& twin_id, const std::string& component, const Json& patch,
                       const std::string& if_match = {}) const;

  const ServiceContext& context() const {
    return ctx_;
  }

 private:
  ServiceContext ctx_;
};

} // namespace twingraph::client
