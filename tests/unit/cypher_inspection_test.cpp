#include "internal/query/cypher_inspection.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace twingraph::query;

namespace {

void TestForbiddenKeywords() {
  auto set = FindForbiddenKeyword("MATCH (n:Twin) SET n.x = 1 RETURN n");
  assert(set && *set == "SET");

  auto detach = FindForbiddenKeyword("match (n) detach delete n");
  assert(detach && *detach == "DETACH");

  assert(!FindForbiddenKeyword("MATCH (n:Twin) WHERE n.name = 'SET ME' RETURN n"));
  assert(!FindForbiddenKeyword("MATCH (n:Twin) WHERE n.created_at > 0 RETURN n.offset"));
}

void TestReturnColumns() {
  assert((ReturnColumns("MATCH (T:Twin) RETURN *") == std::vector<std::string>{"T"}));
  assert((ReturnColumns("MATCH (a:Twin)-[r:contains]->(b:Twin) RETURN *") ==
          std::vector<std::string>{"a", "r", "b"}));
  assert((ReturnColumns("MATCH (a)-[r]->(b) RETURN a.name AS n, b") == std::vector<std::string>{"n", "b"}));
  assert((ReturnColumns("MATCH (a) RETURN a ORDER BY a.name LIMIT 3") == std::vector<std::string>{"a"}));
  assert((ReturnColumns("MATCH (a) RETURN a, a") == std::vector<std::string>{"a", "_col1"}));
  assert((ReturnColumns("MATCH (a) RETURN coalesce(a.x, 'RETURN b')") ==
          std::vector<std::string>{"coalesce(a.x, 'RETURN b')"}));
  assert(ReturnColumns("MATCH (a)").empty());
}

void TestPagingClauses() {
  assert(FindLimit("MATCH (n) RETURN n LIMIT 10") == 10);
  assert(!FindLimit("MATCH (n) RETURN n"));
  assert(!FindLimit("MATCH (n) WHERE n.x = 'LIMIT 4' RETURN n"));
  assert(FindSkip("MATCH (n) RETURN n SKIP 5 LIMIT 10") == 5);
  assert(!FindSkip("MATCH (n) RETURN n LIMIT 10"));

  assert(StripLimit("MATCH (n) RETURN n LIMIT 10") == "MATCH (n) RETURN n");
  assert(StripLimit("MATCH (n) RETURN n") == "MATCH (n) RETURN n");
}

void TestVariableLengthEdges() {
  assert(HasVariableLengthEdge("MATCH (a)-[*1..3]->(b) RETURN b"));
  assert(HasVariableLengthEdge("MATCH (a)-[r:feeds*]->(b) RETURN b"));
  assert(!HasVariableLengthEdge("MATCH (a)-[r:feeds]->(b) RETURN b"));
  assert(!HasVariableLengthEdge("MATCH (a) WHERE a.p = '[x*]' RETURN a"));
}

} // namespace

int main() {
  TestForbiddenKeywords();
  TestReturnColumns();
  TestPagingClauses();
  TestVariableLengthEdges();

  std::cout << "twingraph_unit_cypher_inspection: pass\n";
  return 0;
}
