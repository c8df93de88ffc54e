#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/api/result.hpp"
#include "internal/util/json.hpp"

namespace twingraph::graph {

using util::Json;

enum class SessionRole {
  // read may be served by a replica
  kPreferReplica,
  // primary only: writes and variable-length traversals
  kReadWrite
};

enum class ValueKind {
  Scalar,
  Vertex,
  Edge
};

/*
  One decoded result cell.

  Vertices and edges carry {"id", "label", "properties"} (edges also
  "start_id" and "end_id"); scalars carry the plain JSON value.
*/
struct GraphValue {
  ValueKind kind = ValueKind::Scalar;
  Json      value;
};

struct QueryRows {
  std::vector<std::string>             columns;
  std::vector<std::vector<GraphValue>> rows;
};

// Targeted write below the twin root. An empty value removes the key.
struct PropertyMutation {
  std::vector<std::string> path;
  std::optional<Json>      value;
};

/*
  GraphStore

  Boundary to the labeled-property-graph engine.

  GUARANTEES:

  - Every call is one engine statement (UpsertRelationships: one per call)
  - Twin ids and model ids are unique; violations are AlreadyExists
  - A twin with edges cannot be deleted (ConstraintViolation)
  - A model with incoming dependency edges cannot be deleted
    (ConstraintViolation)
  - *IfMatch / MutateTwin write only while the stored $etag equals the
    expected one; otherwise Conflict (or NotFound when absent)
*/

class GraphStore {
 public:
  virtual ~GraphStore() = default;

  // ---------------------------------------------------------------------
  // Query
  // ---------------------------------------------------------------------

  virtual QueryRows Execute(const std::string& cypher, SessionRole role) = 0;

  // ---------------------------------------------------------------------
  // Twins
  // ---------------------------------------------------------------------

  virtual std::optional<Json> GetTwin(const std::string& id) = 0;

  // Subset of ids that exist, in no particular order.
  virtual std::vector<std::string> FindExistingTwins(const std::vector<std::string>& ids) = 0;

  virtual Result UpsertTwin(const Json& twin) = 0;

  virtual Result ReplaceTwinIfMatch(const Json& twin, const std::string& expected_etag) = 0;

  virtual Result MutateTwin(const std::string& id, const std::vector<PropertyMutation>& mutations,
                            const std::string& expected_etag) = 0;

  virtual Result DeleteTwin(const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Relationships
  // ---------------------------------------------------------------------

  virtual std::optional<Json> GetRelationship(const std::string& source_id, const std::string& relationship_id) = 0;

  virtual std::vector<Json> ListRelationships(const std::string&                source_id,
                                              const std::optional<std::string>& relationship_name) = 0;

  virtual std::vector<Json> ListIncomingRelationships(const std::string& target_id) = 0;

  // NotFound when either endpoint is missing.
  virtual Result UpsertRelationship(const Json& relationship) = 0;

  // All items share relationship_name. Items whose endpoints vanished are not
  // written; their indexes are appended to `unwritten`.
  virtual Result UpsertRelationships(const std::string& relationship_name, const std::vector<Json>& relationships,
                                     std::vector<std::size_t>& unwritten) = 0;

  virtual Result ReplaceRelationshipIfMatch(const Json& relationship, const std::string& expected_etag) = 0;

  virtual Result DeleteRelationship(const std::string& source_id, const std::string& relationship_id) = 0;

  // ---------------------------------------------------------------------
  // Models
  // ---------------------------------------------------------------------

  // All or nothing; AlreadyExists when any id is taken.
  virtual Result InsertModels(const std::vector<Json>& models) = 0;

  virtual std::optional<Json> GetModel(const std::string& id) = 0;

  // Empty dependencies_for lists everything; otherwise the named models plus their bases.
  virtual std::vector<Json> ListModels(const std::vector<std::string>& dependencies_for) = 0;

  virtual Result AddModelEdge(const std::string& from_id, const std::string& to_id, const std::string& label) = 0;

  // Idempotent.
  virtual Result EnsureEdgeLabel(const std::string& label) = 0;

  virtual Result DeleteModel(const std::string& id) = 0;

  // NotFound when there was nothing to delete.
  virtual Result DeleteAllModels() = 0;
};

} // namespace twingraph::graph
