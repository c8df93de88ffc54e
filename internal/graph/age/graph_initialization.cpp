#include "internal/graph/age/graph_initialization.hpp"

#include "internal/observability/logging.hpp"

namespace twingraph::graph::age {

std::vector<std::string> GraphInitCommands(const std::string& g) {
  return {
      "SELECT create_vlabel('" + g + "', 'Twin')",
      "CREATE UNIQUE INDEX twin_id_idx ON " + g +
          ".\"Twin\" (ag_catalog.agtype_access_operator(properties, '\"$dtId\"'::agtype))",
      "CREATE INDEX twin_model_id_idx ON " + g +
          ".\"Twin\" (ag_catalog.agtype_access_operator(properties, '\"$metadata\"'::agtype, '\"$model\"'::agtype))",
      "CREATE INDEX twin_gin_idx ON " + g + ".\"Twin\" USING gin (properties)",
      "ALTER TABLE " + g + ".\"Twin\" REPLICA IDENTITY FULL",

      "SELECT create_vlabel('" + g + "', 'Model')",
      "CREATE UNIQUE INDEX model_id_idx ON " + g +
          ".\"Model\" (ag_catalog.agtype_access_operator(properties, '\"id\"'::agtype))",
      "CREATE INDEX model_gin_idx ON " + g + ".\"Model\" USING gin (properties)",
      "CREATE INDEX model_bases_gin_idx ON " + g +
          ".\"Model\" USING gin ((ag_catalog.agtype_access_operator(properties, '\"bases\"'::agtype)))",
      "ALTER TABLE " + g + ".\"Model\" REPLICA IDENTITY FULL",

      "SELECT create_elabel('" + g + "', '_extends')",
      "ALTER TABLE " + g + ".\"_extends\" REPLICA IDENTITY FULL",
      "SELECT create_elabel('" + g + "', '_hasComponent')",
      "ALTER TABLE " + g + ".\"_hasComponent\" REPLICA IDENTITY FULL",
  };
}

std::vector<std::string> GraphFunctionCommands(const std::string& g) {
  // is_of_model answers inheritance from the flattened bases array, so
  // replicas can run it without a variable-length traversal.
  std::string is_of_model = "CREATE OR REPLACE FUNCTION " + g +
                            R"SQL(.is_of_model(twin agtype, model_id agtype, exact boolean default false)
RETURNS boolean
LANGUAGE plpgsql
STABLE
AS $function$
DECLARE
    twin_model_id text;
    model_id_text text;
BEGIN
    twin_model_id := trim(both '"' from ag_catalog.agtype_access_operator(twin, '"$metadata"'::agtype, '"$model"'::agtype)::text);
    model_id_text := trim(both '"' from model_id::text);

    IF twin_model_id = model_id_text THEN
        RETURN true;
    END IF;
    IF exact THEN
        RETURN false;
    END IF;

    RETURN EXISTS (
        SELECT 1 FROM )SQL" + g +
                            R"SQL(."Model" m
        WHERE trim(both '"' from ag_catalog.agtype_access_operator(m.properties, '"id"'::agtype)::text) = twin_model_id
          AND ag_catalog.agtype_access_operator(m.properties, '"bases"'::agtype) @> ('[' || to_json(model_id_text)::text || ']')::agtype
    );
END;
$function$)SQL";

  std::string agtype_set = "CREATE OR REPLACE FUNCTION " + g +
                           R"SQL(.agtype_set(target agtype, path agtype, new_value agtype)
RETURNS agtype AS $$
DECLARE
    json_target jsonb;
    json_new_value jsonb;
    text_path text[];
BEGIN
    json_target := target::json::jsonb;
    text_path := ARRAY(SELECT json_array_elements_text(path::json));
    json_new_value := new_value::json::jsonb;
    json_target := jsonb_set(json_target, text_path, json_new_value, true);
    RETURN json_target::text::agtype;
END;
$$ LANGUAGE plpgsql)SQL";

  std::string agtype_delete_key = "CREATE OR REPLACE FUNCTION " + g +
                                  R"SQL(.agtype_delete_key(target agtype, path agtype)
RETURNS agtype AS $$
DECLARE
    json_target jsonb;
    text_path text[];
BEGIN
    json_target := target::json::jsonb;
    text_path := ARRAY(SELECT json_array_elements_text(path::json));
    json_target := json_target #- text_path;
    RETURN json_target::text::agtype;
END;
$$ LANGUAGE plpgsql)SQL";

  return {std::move(is_of_model), std::move(agtype_set), std::move(agtype_delete_key)};
}

bool InitializeGraph(pqxx::connection& conn, const std::string& graph_name) {
  pqxx::work tx(conn);

  const auto existing = tx.exec_params("SELECT count(*) FROM ag_catalog.ag_graph WHERE name = $1", graph_name);
  const bool create   = existing[0][0].as<long>() == 0;

  if (create) {
    tx.exec_params("SELECT ag_catalog.create_graph($1)", graph_name);
    for (const auto& command : GraphInitCommands(graph_name)) {
      tx.exec(command);
    }
  }
  for (const auto& command : GraphFunctionCommands(graph_name)) {
    tx.exec(command);
  }
  tx.commit();

  TWINGRAPH_LOG_INFO("graph ready", {observability::StringField("graph", graph_name),
                                     observability::BoolField("created", create)});
  return create;
}

} // namespace twingraph::graph::age
