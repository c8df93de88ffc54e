#pragma once

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "internal/graph/graph_store.hpp"

namespace twingraph::graph::memory {

/*
  In-process graph engine.

  Enforces the same uniqueness, endpoint, referential-integrity and
  conditional-write rules as the AGE store. It has no Cypher engine:
  Execute() throws util::Unsupported.
*/
class MemoryGraphStore : public GraphStore {
 public:
  MemoryGraphStore();

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

  // Introspection for tests.
  bool HasEdgeLabel(const std::string& label) const;
  std::size_t ModelEdgeCount(const std::string& label) const;

 private:
  using EdgeKey = std::pair<std::string, std::string>;  // source id, relationship id

  struct ModelEdge {
    std::string from;
    std::string to;
    std::string label;
  };

  struct State {
    std::map<std::string, Json> twins;
    std::map<EdgeKey, Json>     relationships;
    std::map<std::string, Json> models;
    std::vector<ModelEdge>      model_edges;
    std::set<std::string>       edge_labels;
  };

  static EdgeKey KeyOf(const Json& relationship);
  bool           EndpointsExist(const Json& relationship) const;

  mutable std::mutex mutex_;
  State              state_;
};

} // namespace twingraph::graph::memory
