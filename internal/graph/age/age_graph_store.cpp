#include "internal/graph/age/age_graph_store.hpp"

#include <regex>
#include <set>
#include <utility>

#include "internal/graph/age/agtype.hpp"
#include "internal/query/cypher_inspection.hpp"
#include "internal/util/errors.hpp"

namespace twingraph::graph::age {

namespace {

constexpr const char* kDollarQuote = "$tg$";

std::string StringAt(const Json& object, const char* key) {
  if (!object.is_object()) return {};
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

// `label` with embedded backticks doubled.
std::string QuoteLabel(const std::string& label) {
  std::string out = "`";
  for (const char c : label) {
    if (c == '`') out += '`';
    out += c;
  }
  out += '`';
  return out;
}

std::string QuoteColumn(const std::string& column) {
  std::string out = "\"";
  for (const char c : column) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string TwinNode(const std::string& variable, const std::string& id) {
  return "(" + variable + ":Twin {`$dtId`: " + QuoteLiteral(id) + "})";
}

std::string RelationshipPattern(const std::string& source_id, const std::string& relationship_id) {
  return TwinNode("", source_id) + "-[rel {`$relationshipId`: " + QuoteLiteral(relationship_id) + "}]->(:Twin)";
}

std::string PathList(const std::vector<std::string>& path) {
  std::string out = "[";
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += ",";
    out += QuoteLiteral(path[i]);
  }
  return out + "]";
}

std::string IdList(const std::vector<std::string>& ids) {
  return PathList(ids);
}

Json Properties(const GraphValue& value) {
  if (value.kind == ValueKind::Scalar) return value.value;
  return value.value.contains("properties") ? value.value["properties"] : Json::object();
}

} // namespace

AgeGraphStore::AgeGraphStore(std::shared_ptr<AgePool> primary, std::shared_ptr<AgePool> replica,
                             std::string graph_name)
    : primary_(std::move(primary)), replica_(std::move(replica)), graph_name_(std::move(graph_name)) {
  static const std::regex kGraphName(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
  if (!std::regex_match(graph_name_, kGraphName)) {
    throw util::InvalidArgument("Invalid graph name: " + graph_name_);
  }
  if (!primary_) {
    throw util::InvalidArgument("AgeGraphStore requires a primary connection pool");
  }
}

AgePool& AgeGraphStore::PoolFor(SessionRole role) const {
  if (role == SessionRole::kPreferReplica && replica_) return *replica_;
  return *primary_;
}

std::string AgeGraphStore::WrapCypher(const std::string& cypher, const std::vector<std::string>& columns) const {
  if (cypher.find(kDollarQuote) != std::string::npos) {
    throw util::InvalidArgument("Query text may not contain " + std::string(kDollarQuote));
  }

  std::string sql = "SELECT * FROM ag_catalog.cypher('" + graph_name_ + "', " + kDollarQuote + cypher + kDollarQuote +
                    ") AS (";
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += QuoteColumn(columns[i]) + " agtype";
  }
  return sql + ")";
}

QueryRows AgeGraphStore::Execute(const std::string& cypher, SessionRole role) {
  QueryRows out;
  out.columns = query::ReturnColumns(cypher);
  if (out.columns.empty()) out.columns.push_back("result");

  auto       conn = PoolFor(role).Acquire();
  pqxx::work tx(*conn);
  const auto res = tx.exec(WrapCypher(cypher, out.columns));
  tx.commit();

  out.rows.reserve(res.size());
  for (const auto& row : res) {
    std::vector<GraphValue> cells;
    cells.reserve(row.size());
    for (const auto& field : row) {
      if (field.is_null()) {
        cells.push_back({ValueKind::Scalar, Json()});
      } else {
        cells.push_back(DecodeAgtype(field.c_str()));
      }
    }
    out.rows.push_back(std::move(cells));
  }
  return out;
}

std::vector<Json> AgeGraphStore::Entities(const std::string& cypher, SessionRole role) {
  std::vector<Json> out;
  for (const auto& row : Execute(cypher, role).rows) {
    if (!row.empty()) out.push_back(Properties(row.front()));
  }
  return out;
}

std::int64_t AgeGraphStore::Count(const std::string& cypher) {
  const auto rows = Execute(cypher, SessionRole::kReadWrite).rows;
  if (rows.empty() || rows.front().empty() || !rows.front().front().value.is_number()) return 0;
  return rows.front().front().value.get<std::int64_t>();
}

Result AgeGraphStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  const std::string message = e.what();
  if (message.find("has edge") != std::string::npos ||
      message.find("check_for_connected_edges") != std::string::npos) {
    return Result::Err(ErrorCode::ConstraintViolation, message);
  }
  return Result::Err(ErrorCode::InternalError, message);
}

// ------------------------------------------------------------
// Twins
// ------------------------------------------------------------

std::optional<Json> AgeGraphStore::GetTwin(const std::string& id) {
  auto twins = Entities("MATCH " + TwinNode("t", id) + " RETURN t", SessionRole::kPreferReplica);
  if (twins.empty()) return std::nullopt;
  return std::move(twins.front());
}

std::vector<std::string> AgeGraphStore::FindExistingTwins(const std::vector<std::string>& ids) {
  std::vector<std::string> found;
  if (ids.empty()) return found;

  const auto rows = Execute("MATCH (t:Twin) WHERE t.`$dtId` IN " + IdList(ids) + " RETURN t.`$dtId` AS twinId",
                            SessionRole::kReadWrite)
                        .rows;
  for (const auto& row : rows) {
    if (!row.empty() && row.front().value.is_string()) {
      found.push_back(row.front().value.get<std::string>());
    }
  }
  return found;
}

Result AgeGraphStore::UpsertTwin(const Json& twin) {
  const auto id = StringAt(twin, "$dtId");
  try {
    Execute("WITH " + AgtypeLiteral(twin) + " AS twin MERGE " + TwinNode("t", id) + " SET t = twin RETURN t",
            SessionRole::kReadWrite);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result AgeGraphStore::ReplaceTwinIfMatch(const Json& twin, const std::string& expected_etag) {
  const auto id = StringAt(twin, "$dtId");
  try {
    const auto updated = Entities("MATCH " + TwinNode("t", id) + " WHERE t['$etag'] = " +
                                      QuoteLiteral(expected_etag) + " SET t = " + AgtypeLiteral(twin) + " RETURN t",
                                  SessionRole::kReadWrite);
    if (!updated.empty()) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  return GetTwin(id) ? Result::Err(ErrorCode::Conflict, id) : Result::Err(ErrorCode::NotFound, id);
}

Result AgeGraphStore::MutateTwin(const std::string& id, const std::vector<PropertyMutation>& mutations,
                                 const std::string& expected_etag) {
  std::string cypher = "MATCH " + TwinNode("t", id) + " WHERE t['$etag'] = " + QuoteLiteral(expected_etag);
  for (const auto& mutation : mutations) {
    if (mutation.value) {
      cypher += " SET t = " + graph_name_ + ".agtype_set(properties(t), " + PathList(mutation.path) + ", " +
                AgtypeLiteral(*mutation.value) + ")";
    } else {
      cypher += " SET t = " + graph_name_ + ".agtype_delete_key(properties(t), " + PathList(mutation.path) + ")";
    }
  }
  cypher += " RETURN t";

  try {
    if (!Entities(cypher, SessionRole::kReadWrite).empty()) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  return GetTwin(id) ? Result::Err(ErrorCode::Conflict, id) : Result::Err(ErrorCode::NotFound, id);
}

Result AgeGraphStore::DeleteTwin(const std::string& id) {
  try {
    if (Count("MATCH " + TwinNode("t", id) + " DELETE t RETURN COUNT(t) AS deletedCount") <= 0) {
      return Result::Err(ErrorCode::NotFound, id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------
// Relationships
// ------------------------------------------------------------

std::optional<Json> AgeGraphStore::GetRelationship(const std::string& source_id, const std::string& relationship_id) {
  auto edges =
      Entities("MATCH " + RelationshipPattern(source_id, relationship_id) + " RETURN rel", SessionRole::kPreferReplica);
  if (edges.empty()) return std::nullopt;
  return std::move(edges.front());
}

std::vector<Json> AgeGraphStore::ListRelationships(const std::string&                source_id,
                                                   const std::optional<std::string>& relationship_name) {
  const std::string label = relationship_name ? ":" + QuoteLabel(*relationship_name) : "";
  return Entities("MATCH " + TwinNode("", source_id) + "-[rel" + label + "]->(:Twin) RETURN rel",
                  SessionRole::kPreferReplica);
}

std::vector<Json> AgeGraphStore::ListIncomingRelationships(const std::string& target_id) {
  return Entities("MATCH (:Twin)-[rel]->" + TwinNode("", target_id) + " RETURN rel", SessionRole::kPreferReplica);
}

Result AgeGraphStore::UpsertRelationship(const Json& relationship) {
  const auto source_id = StringAt(relationship, "$sourceId");
  const auto target_id = StringAt(relationship, "$targetId");
  const auto rel_id    = StringAt(relationship, "$relationshipId");
  const auto name      = StringAt(relationship, "$relationshipName");

  const std::string cypher = "WITH " + AgtypeLiteral(relationship) + " AS relationship MATCH " +
                             TwinNode("source", source_id) + ", " + TwinNode("target", target_id) +
                             " MERGE (source)-[rel:" + QuoteLabel(name) +
                             " {`$relationshipId`: " + QuoteLiteral(rel_id) +
                             "}]->(target) SET rel = relationship RETURN rel";
  try {
    if (Entities(cypher, SessionRole::kReadWrite).empty()) {
      return Result::Err(ErrorCode::NotFound, "source or target twin does not exist");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result AgeGraphStore::UpsertRelationships(const std::string&       relationship_name,
                                          const std::vector<Json>& relationships,
                                          std::vector<std::size_t>& unwritten) {
  if (relationships.empty()) return Result::Ok();

  Json batch = Json::array();
  for (const auto& relationship : relationships) batch.push_back(relationship);

  const std::string cypher = "WITH " + AgtypeLiteral(batch) +
                             " AS batch UNWIND batch AS relationship"
                             " MATCH (source:Twin {`$dtId`: relationship['$sourceId']})"
                             " MATCH (target:Twin {`$dtId`: relationship['$targetId']})"
                             " MERGE (source)-[r:" +
                             QuoteLabel(relationship_name) +
                             " {`$relationshipId`: relationship['$relationshipId']}]->(target)"
                             " SET r = relationship RETURN r";
  std::set<std::pair<std::string, std::string>> written;
  try {
    for (const auto& edge : Entities(cypher, SessionRole::kReadWrite)) {
      written.emplace(StringAt(edge, "$sourceId"), StringAt(edge, "$relationshipId"));
    }
  } catch (const std::exception& e) {
    return Translate(e);
  }

  // MATCH drops rows whose endpoints no longer exist
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    const auto key =
        std::make_pair(StringAt(relationships[i], "$sourceId"), StringAt(relationships[i], "$relationshipId"));
    if (written.count(key) == 0) unwritten.push_back(i);
  }
  return Result::Ok();
}

Result AgeGraphStore::ReplaceRelationshipIfMatch(const Json& relationship, const std::string& expected_etag) {
  const auto source_id = StringAt(relationship, "$sourceId");
  const auto rel_id    = StringAt(relationship, "$relationshipId");
  try {
    const auto updated =
        Entities("MATCH " + RelationshipPattern(source_id, rel_id) + " WHERE rel['$etag'] = " +
                     QuoteLiteral(expected_etag) + " SET rel = " + AgtypeLiteral(relationship) + " RETURN rel",
                 SessionRole::kReadWrite);
    if (!updated.empty()) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  return GetRelationship(source_id, rel_id) ? Result::Err(ErrorCode::Conflict) : Result::Err(ErrorCode::NotFound);
}

Result AgeGraphStore::DeleteRelationship(const std::string& source_id, const std::string& relationship_id) {
  try {
    if (Count("MATCH " + RelationshipPattern(source_id, relationship_id) +
              " DELETE rel RETURN COUNT(rel) AS deletedCount") <= 0) {
      return Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------
// Models
// ------------------------------------------------------------

Result AgeGraphStore::InsertModels(const std::vector<Json>& models) {
  if (models.empty()) return Result::Ok();

  Json batch = Json::array();
  for (const auto& model : models) batch.push_back(model);

  // CREATE, not MERGE: model_id_idx turns an existing id into a unique violation
  try {
    Execute("WITH " + AgtypeLiteral(batch) +
                " AS batch UNWIND batch AS model CREATE (m:Model {id: model['id']}) SET m = model RETURN m",
            SessionRole::kReadWrite);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<Json> AgeGraphStore::GetModel(const std::string& id) {
  auto models = Entities("MATCH (m:Model {id: " + QuoteLiteral(id) + "}) RETURN m", SessionRole::kPreferReplica);
  if (models.empty()) return std::nullopt;
  return std::move(models.front());
}

std::vector<Json> AgeGraphStore::ListModels(const std::vector<std::string>& dependencies_for) {
  if (dependencies_for.empty()) {
    return Entities("MATCH (m:Model) RETURN m", SessionRole::kPreferReplica);
  }

  const auto ids = IdList(dependencies_for);
  return Entities("MATCH (m:Model) WHERE m.id IN " + ids +
                      " RETURN m"
                      " UNION"
                      " UNWIND " +
                      ids +
                      " AS modelId MATCH (m1:Model {id: modelId}) UNWIND m1.bases AS dependency"
                      " MATCH (m:Model {id: dependency}) RETURN m",
                  SessionRole::kPreferReplica);
}

Result AgeGraphStore::AddModelEdge(const std::string& from_id, const std::string& to_id, const std::string& label) {
  try {
    const auto created = Execute("MATCH (m:Model), (m2:Model) WHERE m.id = " + QuoteLiteral(from_id) +
                                     " AND m2.id = " + QuoteLiteral(to_id) + " CREATE (m)-[:" + QuoteLabel(label) +
                                     "]->(m2) RETURN m.id",
                                 SessionRole::kReadWrite);
    if (created.rows.empty()) return Result::Err(ErrorCode::NotFound, from_id + " -> " + to_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result AgeGraphStore::EnsureEdgeLabel(const std::string& label) {
  try {
    auto       conn = primary_->Acquire();
    pqxx::work tx(*conn);

    const auto exists = tx.exec_params(
        "SELECT EXISTS (SELECT FROM information_schema.tables WHERE table_schema = $1 AND table_name = $2)",
        graph_name_, label);
    if (exists[0][0].as<bool>()) {
      return Result::Ok();
    }

    tx.exec_params("SELECT ag_catalog.create_elabel($1, $2)", graph_name_, label);
    // full row images so change feeds see every property of an updated edge
    tx.exec("ALTER TABLE " + tx.quote_name(graph_name_) + "." + tx.quote_name(label) + " REPLICA IDENTITY FULL");
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result AgeGraphStore::DeleteModel(const std::string& id) {
  try {
    // outgoing dependency edges go with the model; incoming ones make AGE refuse
    if (Count("MATCH (m:Model {id: " + QuoteLiteral(id) +
              "}) OPTIONAL MATCH (m)-[r]->(:Model) DELETE r, m RETURN COUNT(m) AS deletedCount") <= 0) {
      return Result::Err(ErrorCode::NotFound, id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result AgeGraphStore::DeleteAllModels() {
  try {
    if (Count("MATCH (m:Model) DETACH DELETE m RETURN COUNT(m) AS deletedCount") <= 0) {
      return Result::Err(ErrorCode::NotFound, "No models found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace twingraph::graph::age
