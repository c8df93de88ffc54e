#include "internal/graph/age/agtype.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace twingraph::graph::age {
namespace {

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string StripAnnotations(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool in_string = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];

    if (in_string) {
      out += c;
      if (c == '\\' && i + 1 < text.size()) {
        out += text[++i];
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += c;
      continue;
    }

    if (c == ':' && i + 1 < text.size() && text[i + 1] == ':') {
      i += 2;
      while (i < text.size() && IsWordChar(text[i])) ++i;
      --i;
      continue;
    }

    if (std::isalpha(static_cast<unsigned char>(c))) {
      std::size_t end = i;
      while (end < text.size() && IsWordChar(text[end])) ++end;
      const auto word = text.substr(i, end - i);
      // JSON has no spelling for non-finite floats
      if (word == "NaN" || word == "Infinity") {
        if (!out.empty() && out.back() == '-') out.pop_back();
        out += "null";
      } else {
        out.append(word.data(), word.size());
      }
      i = end - 1;
      continue;
    }

    out += c;
  }
  return out;
}

} // namespace

GraphValue DecodeAgtype(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  GraphValue value;
  if (EndsWith(text, "::vertex")) {
    value.kind = ValueKind::Vertex;
  } else if (EndsWith(text, "::edge")) {
    value.kind = ValueKind::Edge;
  }

  try {
    value.value = Json::parse(StripAnnotations(text));
  } catch (const Json::parse_error& e) {
    throw util::Unsupported(std::string("Undecodable agtype value: ") + e.what());
  }
  return value;
}

std::string QuoteLiteral(std::string_view value) {
  std::string out = "'";
  for (const char c : value) {
    if (c == '\\' || c == '\'') out += '\\';
    out += c;
  }
  out += '\'';
  return out;
}

std::string AgtypeLiteral(const Json& value) {
  return QuoteLiteral(value.dump()) + "::agtype";
}

} // namespace twingraph::graph::age
