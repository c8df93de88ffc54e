#pragma once

#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace twingraph::graph::age {

/*
  Graph bootstrap for Apache AGE.

  Creates the graph with its Twin/Model vertex labels, the unique
  indexes the stores rely on ($dtId, model id), the _extends and
  _hasComponent edge labels, and the server-side helper functions
  used by compiled queries and targeted twin mutations.
*/

// One-time DDL for a freshly created graph.
std::vector<std::string> GraphInitCommands(const std::string& graph_name);

// CREATE OR REPLACE FUNCTION statements; safe to rerun.
std::vector<std::string> GraphFunctionCommands(const std::string& graph_name);

// Creates the graph when missing, then (re)installs the functions.
// Returns true when the graph was created by this call.
bool InitializeGraph(pqxx::connection& conn, const std::string& graph_name);

} // namespace twingraph::graph::age
