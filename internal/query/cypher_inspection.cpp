#include "internal/query/cypher_inspection.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace twingraph::query {
namespace {

constexpr std::size_t kMaxColumnName = 63;

// Same length as the input with string literal contents blanked, so keyword
// searches never match inside quotes and offsets stay aligned.
std::string MaskLiterals(std::string_view text) {
  std::string masked(text);
  char        quote = 0;
  for (std::size_t i = 0; i < masked.size(); ++i) {
    const char c = masked[i];
    if (quote != 0) {
      if (c == '\\' && i + 1 < masked.size()) {
        masked[i]     = '_';
        masked[i + 1] = '_';
        ++i;
        continue;
      }
      if (c == quote) {
        quote = 0;
        continue;
      }
      masked[i] = '_';
    } else if (c == '\'' || c == '"') {
      quote = c;
    }
  }
  return masked;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return std::string(text.substr(begin, end - begin));
}

std::optional<std::smatch> LastMatch(const std::string& text, const std::regex& pattern) {
  std::optional<std::smatch> last;
  for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
    last = *it;
  }
  return last;
}

std::optional<std::int64_t> FindClauseValue(std::string_view cypher, const std::regex& pattern) {
  const auto masked = MaskLiterals(cypher);
  auto       match  = LastMatch(masked, pattern);
  if (!match) return std::nullopt;
  return std::strtoll((*match)[1].str().c_str(), nullptr, 10);
}

std::vector<std::string> PatternVariables(const std::string& masked_prefix) {
  static const std::regex kVariable(R"([\(\[]\s*([A-Za-z_][A-Za-z0-9_]*)\s*(?=[:\)\]\{\*]))");

  std::vector<std::string> variables;
  for (std::sregex_iterator it(masked_prefix.begin(), masked_prefix.end(), kVariable), end; it != end; ++it) {
    auto name = (*it)[1].str();
    if (std::find(variables.begin(), variables.end(), name) == variables.end()) {
      variables.push_back(std::move(name));
    }
  }
  return variables;
}

std::vector<std::string> SplitTopLevel(std::string_view masked, std::string_view original) {
  std::vector<std::string> items;
  int                      depth = 0;
  std::size_t              start = 0;
  for (std::size_t i = 0; i < masked.size(); ++i) {
    const char c = masked[i];
    if (c == '(' || c == '[' || c == '{') ++depth;
    if (c == ')' || c == ']' || c == '}') --depth;
    if (c == ',' && depth == 0) {
      items.push_back(Trim(original.substr(start, i - start)));
      start = i + 1;
    }
  }
  items.push_back(Trim(original.substr(start)));
  return items;
}

} // namespace

bool HasVariableLengthEdge(std::string_view cypher) {
  static const std::regex kVariableLengthEdge(R"(\[[^\]]*(?::\w*)?\*[\d.]*\])");
  const auto              masked = MaskLiterals(cypher);
  return std::regex_search(masked, kVariableLengthEdge);
}

std::optional<std::string> FindForbiddenKeyword(std::string_view cypher) {
  static const std::regex kWriteKeyword(R"(\b(CREATE|DELETE|DETACH|SET|MERGE|REMOVE)\b)", std::regex::icase);

  const auto  masked = MaskLiterals(cypher);
  std::smatch match;
  if (!std::regex_search(masked, match, kWriteKeyword)) {
    return std::nullopt;
  }
  auto keyword = match[1].str();
  std::transform(keyword.begin(), keyword.end(), keyword.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return keyword;
}

std::vector<std::string> ReturnColumns(std::string_view cypher) {
  static const std::regex kReturn(R"(\bRETURN\s+(DISTINCT\s+)?)", std::regex::icase);
  static const std::regex kTail(R"(\s+(ORDER\s+BY|SKIP|LIMIT)\b)", std::regex::icase);
  static const std::regex kAlias(R"(\s+AS\s+([A-Za-z_][A-Za-z0-9_]*)\s*$)", std::regex::icase);

  const auto masked = MaskLiterals(cypher);
  auto       ret    = LastMatch(masked, kReturn);
  if (!ret) return {};

  const auto  begin = static_cast<std::size_t>(ret->position(0) + ret->length(0));
  std::string tail  = masked.substr(begin);
  std::size_t end   = masked.size();

  std::smatch tail_match;
  if (std::regex_search(tail, tail_match, kTail)) {
    end = begin + static_cast<std::size_t>(tail_match.position(0));
  }

  const auto masked_items   = std::string_view(masked).substr(begin, end - begin);
  const auto original_items = cypher.substr(begin, end - begin);

  if (Trim(masked_items) == "*") {
    return PatternVariables(masked.substr(0, static_cast<std::size_t>(ret->position(0))));
  }

  std::vector<std::string> columns;
  const auto               masked_split = SplitTopLevel(masked_items, masked_items);
  const auto               items        = SplitTopLevel(masked_items, original_items);
  for (std::size_t i = 0; i < items.size(); ++i) {
    std::smatch alias;
    std::string name = items[i];
    if (std::regex_search(masked_split[i], alias, kAlias)) {
      name = alias[1].str();
    }
    if (name.empty() || name.size() > kMaxColumnName ||
        std::find(columns.begin(), columns.end(), name) != columns.end()) {
      name = "_col" + std::to_string(i);
    }
    columns.push_back(std::move(name));
  }
  return columns;
}

std::optional<std::int64_t> FindLimit(std::string_view cypher) {
  static const std::regex kLimit(R"(\bLIMIT\s+(\d+))", std::regex::icase);
  return FindClauseValue(cypher, kLimit);
}

std::optional<std::int64_t> FindSkip(std::string_view cypher) {
  static const std::regex kSkip(R"(\bSKIP\s+(\d+))", std::regex::icase);
  return FindClauseValue(cypher, kSkip);
}

std::string StripLimit(std::string_view cypher) {
  static const std::regex kTrailingLimit(R"(\s*\bLIMIT\s+\d+\s*$)", std::regex::icase);

  const auto  masked = MaskLiterals(cypher);
  std::smatch match;
  if (!std::regex_search(masked, match, kTrailingLimit)) {
    return std::string(cypher);
  }
  return std::string(cypher.substr(0, static_cast<std::size_t>(match.position(0))));
}

} // namespace twingraph::query
