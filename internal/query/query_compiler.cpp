#include "internal/query/query_compiler.hpp"

#include <cctype>

#include "internal/query/cypher_generator.hpp"
#include "internal/query/parser.hpp"

namespace twingraph::query {
namespace {

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Whole words only, case-insensitive; quoted literals are skipped.
bool ContainsWord(std::string_view text, std::string_view upper_word) {
  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\'' || c == '"') {
      const auto close = text.find(c, i + 1);
      if (close == std::string_view::npos) return false;
      i = close + 1;
      continue;
    }
    if (!IsWordChar(c)) {
      ++i;
      continue;
    }

    const auto begin = i;
    while (i < text.size() && IsWordChar(text[i])) ++i;
    if (i - begin != upper_word.size()) continue;

    bool match = true;
    for (std::size_t j = 0; j < upper_word.size(); ++j) {
      if (std::toupper(static_cast<unsigned char>(text[begin + j])) != upper_word[j]) {
        match = false;
        break;
      }
    }
    if (match) return true;
  }
  return false;
}

} // namespace

CompiledQuery Compile(std::string_view query, std::string_view graph_name) {
  Parser parser(query);
  auto   stmt = parser.ParseSelect();

  CypherGenerator generator{std::string(graph_name)};
  auto            clauses = generator.Generate(stmt);

  CompiledQuery compiled;
  compiled.body = "MATCH " + clauses.pattern;
  if (!clauses.where.empty()) {
    compiled.body += " WHERE " + clauses.where;
  }
  compiled.body += " RETURN " + clauses.projection;

  compiled.text = compiled.body;
  if (stmt.top) {
    compiled.limit = *stmt.top;
    compiled.text += " LIMIT " + std::to_string(*stmt.top);
  }

  compiled.requires_read_write = clauses.variable_length;
  compiled.uses_wildcard       = stmt.wildcard;
  compiled.default_alias       = clauses.default_alias;
  return compiled;
}

bool IsTwinQuery(std::string_view query) {
  return ContainsWord(query, "SELECT") && !ContainsWord(query, "RETURN");
}

} // namespace twingraph::query
