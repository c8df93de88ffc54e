#include "internal/query/query_service.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <regex>

#include "internal/observability/logging.hpp"
#include "internal/query/cypher_inspection.hpp"
#include "internal/query/query_compiler.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace twingraph::query {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

struct ContinuationToken {
  std::int64_t row_number = 0;
  std::string  query;
  bool         unwrap = false;
};

std::string EncodeToken(const ContinuationToken& token) {
  Json json = {{"_tr", token.row_number}, {"_q", token.query}};
  if (token.unwrap) json["_u"] = true;
  return util::Base64Encode(json.dump());
}

ContinuationToken DecodeToken(const std::string& encoded) {
  Json json;
  try {
    json = Json::parse(util::Base64Decode(encoded));
  } catch (const Json::exception&) {
    throw util::InvalidArgument("Invalid continuation token");
  }

  if (!json.is_object() || !json.contains("_tr") || !json["_tr"].is_number_integer() || !json.contains("_q") ||
      !json["_q"].is_string()) {
    throw util::InvalidArgument("Invalid continuation token");
  }

  ContinuationToken token;
  token.row_number = json["_tr"].get<std::int64_t>();
  token.query      = json["_q"].get<std::string>();
  token.unwrap     = json.contains("_u") && json["_u"].is_boolean() && json["_u"].get<bool>();
  if (token.row_number < 0 || token.query.empty()) {
    throw util::InvalidArgument("Invalid continuation token");
  }
  return token;
}

std::string ReplaceClause(const std::string& cypher, const char* keyword, std::int64_t value) {
  const std::regex pattern(std::string("\\b") + keyword + "\\s+\\d+", std::regex::icase);
  return std::regex_replace(cypher, pattern, std::string(keyword) + " " + std::to_string(value));
}

Json FlattenCell(const graph::GraphValue& cell) {
  if (cell.kind == graph::ValueKind::Scalar) return cell.value;
  const auto properties = cell.value.find("properties");
  return properties != cell.value.end() ? *properties : Json::object();
}

} // namespace

QueryService::QueryService(std::shared_ptr<graph::GraphStore> store, std::string graph_name)
    : store_(std::move(store)), graph_name_(std::move(graph_name)) {
}

QueryPage QueryService::Query(const std::string& query, const QueryOptions& options) {
  if (options.max_items_per_page && *options.max_items_per_page == 0) {
    throw util::InvalidArgument("max_items_per_page must be positive");
  }

  std::optional<ContinuationToken> token;
  std::string                      cypher;
  bool                             read_write = false;
  bool                             unwrap     = false;

  if (!options.continuation_token.empty()) {
    token  = DecodeToken(options.continuation_token);
    cypher = token->query;
    unwrap = token->unwrap;
  } else if (query.empty()) {
    throw util::InvalidArgument("Query cannot be null or empty.");
  } else if (IsTwinQuery(query)) {
    const auto compiled = Compile(query, graph_name_);
    cypher              = compiled.text;
    read_write          = compiled.requires_read_write;
    unwrap              = compiled.uses_wildcard && compiled.default_alias;
  } else {
    cypher = query;
  }

  if (const auto keyword = FindForbiddenKeyword(cypher)) {
    throw util::CompileError("Query contains forbidden keyword: " + *keyword + ". Only read-only queries are allowed.");
  }

  const std::string body       = cypher;
  const auto        row_number = token ? token->row_number : 0;
  const auto        limit      = FindLimit(body);

  // rows this page may fetch: what is left of the query's own LIMIT, capped by the page size
  std::optional<std::int64_t> take;
  if (limit) take = *limit - row_number;
  if (options.max_items_per_page) {
    const auto page_size = static_cast<std::int64_t>(*options.max_items_per_page);
    take                 = take ? std::min(*take, page_size) : page_size;
  }
  if (take && *take <= 0) {
    return {};
  }

  if (const auto skip = FindSkip(body)) {
    cypher = ReplaceClause(cypher, "SKIP", *skip + row_number);
  } else if (row_number > 0) {
    cypher = StripLimit(cypher) + " SKIP " + std::to_string(row_number);
  }

  if (take) {
    if (FindLimit(cypher)) {
      cypher = ReplaceClause(cypher, "LIMIT", *take);
    } else {
      cypher += " LIMIT " + std::to_string(*take);
    }
  }

  const auto existing_limit = limit.value_or(std::numeric_limits<std::int64_t>::max());

  read_write = read_write || HasVariableLengthEdge(cypher);

  TWINGRAPH_LOG_DEBUG("query", {StringField("cypher", cypher), BoolField("read_write", read_write),
                                IntField("row_number", row_number)});

  const auto rows =
      store_->Execute(cypher, read_write ? graph::SessionRole::kReadWrite : graph::SessionRole::kPreferReplica);

  QueryPage page;
  page.items.reserve(rows.rows.size());
  for (const auto& row : rows.rows) {
    if (unwrap && row.size() == 1 && row.front().kind != graph::ValueKind::Scalar) {
      page.items.push_back(FlattenCell(row.front()));
      continue;
    }

    Json item = Json::object();
    for (std::size_t i = 0; i < row.size() && i < rows.columns.size(); ++i) {
      if (row[i].value.is_null()) continue;
      item[rows.columns[i]] = FlattenCell(row[i]);
    }
    page.items.push_back(std::move(item));
  }

  const auto next_row = row_number + static_cast<std::int64_t>(page.items.size());
  if (options.max_items_per_page &&
      page.items.size() >= *options.max_items_per_page && next_row < existing_limit) {
    page.continuation_token = EncodeToken({next_row, body, unwrap});
  }
  return page;
}

} // namespace twingraph::query
