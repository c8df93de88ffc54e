#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/graph/age/age_pool.hpp"
#include "internal/graph/graph_store.hpp"

namespace twingraph::graph::age {

/*
  GraphStore over Apache AGE.

  Every operation is one Cypher statement wrapped in
  ag_catalog.cypher() and run in its own transaction. Reads with
  SessionRole::kPreferReplica use the replica pool when one is
  configured. Conditional writes carry the expected $etag in their
  WHERE clause; a zero-row result is then disambiguated into NotFound
  or Conflict.
*/
class AgeGraphStore final : public GraphStore {
 public:
  // replica may be null.
  AgeGraphStore(std::shared_ptr<AgePool> primary, std::shared_ptr<AgePool> replica, std::string graph_name);

  const std::string& graph_name() const {
    return graph_name_;
  }

  QueryRows Execute(const std::string& cypher, SessionRole role) override;

  std::optional<Json>      GetTwin(const std::string& id) override;
  std::vector<std::string> FindExistingTwins(const std::vector<std::string>& ids) override;
  Result                   UpsertTwin(const Json& twin) override;
  Result                   ReplaceTwinIfMatch(const Json& twin, const std::string& expected_etag) override;
  Result MutateTwin(const std::string& id, const std::vector<PropertyMutation>& mutations,
                    const std::string& expected_etag) override;
  Result DeleteTwin(const std::string& id) override;

  std::optional<Json> GetRelationship(const std::string& source_id, const std::string& relationship_id) override;
  std::vector<Json>   ListRelationships(const std::string&                source_id,
                                        const std::optional<std::string>& relationship_name) override;
  std::vector<Json>   ListIncomingRelationships(const std::string& target_id) override;
  Result              UpsertRelationship(const Json& relationship) override;
  Result UpsertRelationships(const std::string& relationship_name, const std::vector<Json>& relationships,
                             std::vector<std::size_t>& unwritten) override;
  Result ReplaceRelationshipIfMatch(const Json& relationship, const std::string& expected_etag) override;
  Result DeleteRelationship(const std::string& source_id, const std::string& relationship_id) override;

  Result              InsertModels(const std::vector<Json>& models) override;
  std::optional<Json> GetModel(const std::string& id) override;
  std::vector<Json>   ListModels(const std::vector<std::string>& dependencies_for) override;
  Result AddModelEdge(const std::string& from_id, const std::string& to_id, const std::string& label) override;
  Result EnsureEdgeLabel(const std::string& label) override;
  Result DeleteModel(const std::string& id) override;
  Result DeleteAllModels() override;

 private:
  AgePool&    PoolFor(SessionRole role) const;
  std::string WrapCypher(const std::string& cypher, const std::vector<std::string>& columns) const;

  // Property bags of the first column, one per row.
  std::vector<Json> Entities(const std::string& cypher, SessionRole role);
  std::int64_t      Count(const std::string& cypher);

  static Result Translate(const std::exception& e);

  std::shared_ptr<AgePool> primary_;
  std::shared_ptr<AgePool> replica_;
  std::string              graph_name_;
};

} // namespace twingraph::graph::age
