#include "internal/dtdl/model_parser.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <utility>

#include "internal/util/errors.hpp"

namespace twingraph::dtdl {
namespace {

const std::map<std::string, SchemaKind>& PrimitiveSchemas() {
  static const std::map<std::string, SchemaKind> kPrimitives = {
      {"boolean", SchemaKind::Boolean},
      {"date", SchemaKind::Date},
      {"dateTime", SchemaKind::DateTime},
      {"double", SchemaKind::Double},
      {"duration", SchemaKind::Duration},
      {"float", SchemaKind::Float},
      {"integer", SchemaKind::Integer},
      {"long", SchemaKind::Long},
      {"string", SchemaKind::String},
      {"time", SchemaKind::Time},
  };
  return kPrimitives;
}

bool IsValidName(const std::string& name) {
  static const std::regex kName(R"(^[A-Za-z](?:[A-Za-z0-9_]*[A-Za-z0-9])?$)");
  return name.size() <= 512 && std::regex_match(name, kName);
}

std::vector<std::string> TypesOf(const Json& node) {
  std::vector<std::string> types;
  if (!node.is_object() || !node.contains("@type")) return types;
  const auto& type = node["@type"];
  if (type.is_string()) {
    types.push_back(type.get<std::string>());
  } else if (type.is_array()) {
    for (const auto& t : type) {
      if (t.is_string()) types.push_back(t.get<std::string>());
    }
  }
  return types;
}

bool HasType(const Json& node, const std::string& type) {
  const auto types = TypesOf(node);
  return std::find(types.begin(), types.end(), type) != types.end();
}

/*
  One Parse() call. Collects raw interfaces (submitted, inline and
  resolved), then builds InterfaceInfo bases-first so inherited
  contents are always available when a derived interface is built.
*/
class ParseSession {
 public:
  explicit ParseSession(const ModelResolver& resolver) : resolver_(resolver) {
  }

  ObjectModel Run(const std::vector<std::string>& documents) {
    for (const auto& document : documents) {
      LoadDocument(document, true);
    }
    ResolveExternalReferences();
    ThrowIfErrors();

    const auto order = OrderBasesFirst();
    ThrowIfErrors();

    for (const auto& id : order) {
      BuildInterface(id);
    }
    ThrowIfErrors();

    model_.roots = roots_;
    return std::move(model_);
  }

 private:
  void Error(std::string message) {
    errors_.push_back(std::move(message));
  }

  void ThrowIfErrors() const {
    if (!errors_.empty()) {
      throw util::ModelParsingError(errors_);
    }
  }

  // ------------------------------------------------------------
  // Loading
  // ------------------------------------------------------------

  void LoadDocument(const std::string& text, bool submitted) {
    Json document;
    try {
      document = Json::parse(text);
    } catch (const Json::parse_error& e) {
      Error(std::string("Invalid JSON document: ") + e.what());
      return;
    }

    if (document.is_array()) {
      for (const auto& element : document) {
        auto id = RegisterInterface(element);
        if (submitted && !id.empty()) roots_.push_back(id);
      }
      return;
    }

    auto id = RegisterInterface(document);
    if (submitted && !id.empty()) roots_.push_back(id);
  }

  std::string RegisterInterface(const Json& node) {
    if (!node.is_object() || !HasType(node, "Interface")) {
      Error("Top-level element is not an Interface: " + node.dump().substr(0, 120));
      return {};
    }
    if (!node.contains("@id") || !node["@id"].is_string() || !IsValidDtmi(node["@id"].get<std::string>())) {
      Error("Interface has a missing or invalid @id: " + node.value("@id", Json()).dump());
      return {};
    }

    const auto id = node["@id"].get<std::string>();
    if (raw_.count(id) > 0) {
      Error("Duplicate definition of " + id);
      return {};
    }
    raw_.emplace(id, node);

    if (node.contains("schemas")) {
      for (const auto& schema : node["schemas"]) {
        if (!schema.is_object() || !schema.contains("@id") || !schema["@id"].is_string()) {
          Error("Schema in " + id + " has no @id");
          continue;
        }
        named_schemas_[schema["@id"].get<std::string>()] = schema;
      }
    }

    // inline interfaces get their own entries
    if (node.contains("extends")) {
      const auto& extends = node["extends"];
      if (extends.is_array()) {
        for (const auto& base : extends) {
          if (base.is_object()) RegisterInterface(base);
        }
      } else if (extends.is_object()) {
        RegisterInterface(extends);
      }
    }
    if (node.contains("contents") && node["contents"].is_array()) {
      for (const auto& content : node["contents"]) {
        if (HasType(content, "Component") && content.contains("schema") && content["schema"].is_object()) {
          RegisterInterface(content["schema"]);
        }
      }
    }

    return id;
  }

  static std::vector<std::string> ExtendsOf(const Json& node) {
    std::vector<std::string> ids;
    if (!node.contains("extends")) return ids;

    auto add = [&ids](const Json& base) {
      if (base.is_string()) ids.push_back(base.get<std::string>());
      if (base.is_object() && base.contains("@id") && base["@id"].is_string()) {
        ids.push_back(base["@id"].get<std::string>());
      }
    };

    const auto& extends = node["extends"];
    if (extends.is_array()) {
      for (const auto& base : extends) add(base);
    } else {
      add(extends);
    }
    return ids;
  }

  static std::vector<std::string> ComponentSchemasOf(const Json& node) {
    std::vector<std::string> ids;
    if (!node.contains("contents") || !node["contents"].is_array()) return ids;
    for (const auto& content : node["contents"]) {
      if (!HasType(content, "Component") || !content.contains("schema")) continue;
      const auto& schema = content["schema"];
      if (schema.is_string()) ids.push_back(schema.get<std::string>());
    }
    return ids;
  }

  void ResolveExternalReferences() {
    std::set<std::string> requested;

    for (;;) {
      std::vector<std::string> missing;
      for (const auto& [id, node] : raw_) {
        auto references = ExtendsOf(node);
        auto components = ComponentSchemasOf(node);
        references.insert(references.end(), components.begin(), components.end());

        for (const auto& reference : references) {
          if (raw_.count(reference) > 0 || requested.count(reference) > 0) continue;
          if (std::find(missing.begin(), missing.end(), reference) != missing.end()) continue;
          if (!IsValidDtmi(reference)) {
            Error("Invalid reference '" + reference + "' in " + id);
            requested.insert(reference);
            continue;
          }
          missing.push_back(reference);
        }
      }

      if (missing.empty()) return;

      requested.insert(missing.begin(), missing.end());
      if (resolver_) {
        for (const auto& document : resolver_(missing)) {
          LoadDocument(document, false);
        }
      }

      for (const auto& id : missing) {
        if (raw_.count(id) == 0) {
          Error("Unable to resolve reference to " + id);
        }
      }
    }
  }

  // ------------------------------------------------------------
  // Ordering
  // ------------------------------------------------------------

  std::vector<std::string> OrderBasesFirst() {
    enum class Mark { Unvisited, InProgress, Done };

    std::map<std::string, Mark> marks;
    std::vector<std::string>    order;

    for (const auto& entry : raw_) {
      if (marks[entry.first] != Mark::Unvisited) continue;

      std::vector<std::pair<std::string, std::size_t>> stack;
      stack.emplace_back(entry.first, 0);
      marks[entry.first] = Mark::InProgress;

      while (!stack.empty()) {
        auto&      frame = stack.back();
        const auto bases = ExtendsOf(raw_.at(frame.first));

        if (frame.second < bases.size()) {
          const auto base = bases[frame.second++];
          if (raw_.count(base) == 0) continue;

          const auto mark = marks[base];
          if (mark == Mark::InProgress) {
            Error("Cycle in extends: " + frame.first + " extends " + base);
            continue;
          }
          if (mark == Mark::Unvisited) {
            marks[base] = Mark::InProgress;
            stack.emplace_back(base, 0);
          }
          continue;
        }

        marks[frame.first] = Mark::Done;
        order.push_back(frame.first);
        stack.pop_back();
      }
    }

    std::map<std::string, int> depth;
    for (const auto& id : order) {
      int d = 0;
      for (const auto& base : ExtendsOf(raw_.at(id))) {
        auto it = depth.find(base);
        if (it != depth.end()) d = std::max(d, it->second + 1);
      }
      depth[id] = d;
      if (d > DtdlModelParser::kMaxExtendsDepth) {
        Error(id + " exceeds the maximum extends depth of " + std::to_string(DtdlModelParser::kMaxExtendsDepth));
      }
    }

    return order;
  }

  // ------------------------------------------------------------
  // Building
  // ------------------------------------------------------------

  void BuildInterface(const std::string& id) {
    const auto& node = raw_.at(id);

    InterfaceInfo info;
    info.id           = id;
    info.display_name = node.value("displayName", Json());
    info.description  = node.value("description", Json());
    info.extends      = ExtendsOf(node);

    for (const auto& base_id : info.extends) {
      const auto* base = model_.Find(base_id);
      if (base == nullptr) continue;
      for (const auto& [name, content] : base->contents) {
        auto existing = info.contents.find(name);
        if (existing != info.contents.end() && existing->second.defined_in != content.defined_in) {
          Error("Content '" + name + "' of " + id + " is inherited from both " + existing->second.defined_in + " and " +
                content.defined_in);
          continue;
        }
        info.contents[name] = content;
      }
    }

    std::set<std::string> own_names;
    if (node.contains("contents")) {
      if (!node["contents"].is_array()) {
        Error("contents of " + id + " must be an array");
      } else {
        for (const auto& element : node["contents"]) {
          auto content = ParseContent(element, id);
          if (content.name.empty()) continue;

          if (!own_names.insert(content.name).second) {
            Error("Duplicate content name '" + content.name + "' in " + id);
            continue;
          }
          if (info.contents.count(content.name) > 0) {
            Error("Content '" + content.name + "' of " + id + " redefines inherited content from " +
                  info.contents[content.name].defined_in);
            continue;
          }
          info.contents.emplace(content.name, std::move(content));
        }
      }
    }

    model_.interfaces.emplace(id, std::move(info));
  }

  ContentInfo ParseContent(const Json& node, const std::string& interface_id) {
    ContentInfo content;
    content.defined_in = interface_id;

    if (!node.is_object()) {
      Error("Content of " + interface_id + " is not an object");
      return content;
    }

    const auto types  = TypesOf(node);
    bool       typed  = false;
    const std::pair<const char*, ContentKind> kKinds[] = {{"Property", ContentKind::Property},
                                                          {"Telemetry", ContentKind::Telemetry},
                                                          {"Relationship", ContentKind::Relationship},
                                                          {"Component", ContentKind::Component},
                                                          {"Command", ContentKind::Command}};
    for (const auto& [type_name, kind] : kKinds) {
      if (std::find(types.begin(), types.end(), type_name) != types.end()) {
        content.kind = kind;
        typed        = true;
        break;
      }
    }

    const auto name = node.value("name", std::string());
    if (!typed) {
      Error("Content '" + name + "' of " + interface_id + " has no recognised @type");
      return content;
    }
    if (!IsValidName(name)) {
      Error("Content of " + interface_id + " has an invalid name '" + name + "'");
      return content;
    }

    const auto context = interface_id + ":" + name;

    switch (content.kind) {
      case ContentKind::Property:
      case ContentKind::Telemetry:
        content.schema   = ResolveSchema(node.value("schema", Json()), context);
        content.writable = node.value("writable", false);
        if (!content.schema) return content;
        break;

      case ContentKind::Component: {
        const auto schema = node.value("schema", Json());
        if (schema.is_string()) {
          content.component_schema = schema.get<std::string>();
        } else if (schema.is_object() && schema.contains("@id")) {
          content.component_schema = schema["@id"].get<std::string>();
        } else {
          Error("Component " + context + " has no interface schema");
          return content;
        }
        break;
      }

      case ContentKind::Relationship:
        if (node.contains("target")) {
          content.target = node["target"].is_string() ? node["target"].get<std::string>() : std::string();
          if (!IsValidDtmi(content.target)) {
            Error("Relationship " + context + " has an invalid target");
            return content;
          }
        }
        if (node.contains("minMultiplicity") && node["minMultiplicity"].is_number_integer()) {
          content.min_multiplicity = node["minMultiplicity"].get<int>();
        }
        if (node.contains("maxMultiplicity") && node["maxMultiplicity"].is_number_integer()) {
          content.max_multiplicity = node["maxMultiplicity"].get<int>();
        }
        if (node.contains("properties") && node["properties"].is_array()) {
          for (const auto& property : node["properties"]) {
            RelationshipProperty rp;
            rp.name     = property.value("name", std::string());
            rp.writable = property.value("writable", false);
            if (!IsValidName(rp.name)) {
              Error("Relationship " + context + " has a property with an invalid name");
              continue;
            }
            rp.schema = ResolveSchema(property.value("schema", Json()), context + ":" + rp.name);
            if (rp.schema) content.properties.push_back(std::move(rp));
          }
        }
        break;

      case ContentKind::Command:
        break;
    }

    content.name = name;
    return content;
  }

  SchemaPtr ResolveSchema(const Json& node, const std::string& context) {
    if (node.is_null()) {
      Error(context + " has no schema");
      return nullptr;
    }

    if (node.is_string()) {
      const auto name       = node.get<std::string>();
      const auto& primitive = PrimitiveSchemas();
      if (auto it = primitive.find(name); it != primitive.end()) {
        auto schema  = std::make_shared<Schema>();
        schema->kind = it->second;
        return schema;
      }
      if (auto it = resolved_schemas_.find(name); it != resolved_schemas_.end()) {
        return it->second;
      }
      auto named = named_schemas_.find(name);
      if (named == named_schemas_.end()) {
        Error("Unknown schema '" + name + "' in " + context);
        return nullptr;
      }
      if (!resolving_.insert(name).second) {
        Error("Schema '" + name + "' refers to itself");
        return nullptr;
      }
      auto schema = ResolveSchema(named->second, name);
      resolving_.erase(name);
      if (schema) resolved_schemas_[name] = schema;
      return schema;
    }

    if (!node.is_object()) {
      Error("Invalid schema in " + context);
      return nullptr;
    }

    auto schema = std::make_shared<Schema>();
    schema->id  = node.value("@id", std::string());

    if (HasType(node, "Object")) {
      schema->kind = SchemaKind::Object;
      for (const auto& field : node.value("fields", Json::array())) {
        SchemaField f;
        f.name = field.value("name", std::string());
        if (!IsValidName(f.name)) {
          Error("Object schema in " + context + " has a field with an invalid name");
          return nullptr;
        }
        f.schema = ResolveSchema(field.value("schema", Json()), context + "." + f.name);
        if (!f.schema) return nullptr;
        schema->fields.push_back(std::move(f));
      }
      return schema;
    }

    if (HasType(node, "Enum")) {
      schema->kind           = SchemaKind::Enum;
      const auto value_kind  = node.value("valueSchema", std::string("integer"));
      schema->enum_value_kind = value_kind == "string" ? SchemaKind::String : SchemaKind::Integer;
      for (const auto& value : node.value("enumValues", Json::array())) {
        EnumValue ev;
        ev.name  = value.value("name", std::string());
        ev.value = value.value("enumValue", Json());
        const bool kind_ok =
            schema->enum_value_kind == SchemaKind::String ? ev.value.is_string() : ev.value.is_number_integer();
        if (!kind_ok) {
          Error("Enum value '" + ev.name + "' in " + context + " does not match valueSchema " + value_kind);
          return nullptr;
        }
        schema->enum_values.push_back(std::move(ev));
      }
      return schema;
    }

    if (HasType(node, "Map")) {
      schema->kind = SchemaKind::Map;
      const auto key = node.value("mapKey", Json::object());
      if (key.value("schema", std::string("string")) != "string") {
        Error("Map schema in " + context + " must have a string key");
        return nullptr;
      }
      schema->map_value = ResolveSchema(node.value("mapValue", Json::object()).value("schema", Json()), context);
      return schema->map_value ? schema : nullptr;
    }

    if (HasType(node, "Array")) {
      schema->kind    = SchemaKind::Array;
      schema->element = ResolveSchema(node.value("elementSchema", Json()), context);
      return schema->element ? schema : nullptr;
    }

    Error("Unsupported schema type in " + context);
    return nullptr;
  }

  const ModelResolver&             resolver_;
  std::vector<std::string>         errors_;
  std::map<std::string, Json>      raw_;
  std::map<std::string, Json>      named_schemas_;
  std::map<std::string, SchemaPtr> resolved_schemas_;
  std::set<std::string>            resolving_;
  std::vector<std::string>         roots_;
  ObjectModel                      model_;
};

} // namespace

bool IsValidDtmi(std::string_view id) {
  static const std::regex kDtmi(
      R"(^dtmi:[A-Za-z](?:[A-Za-z0-9_]*[A-Za-z0-9])?(?::[A-Za-z](?:[A-Za-z0-9_]*[A-Za-z0-9])?)*(?:;[1-9][0-9]{0,8}(?:\.[1-9][0-9]{0,5})?)?$)");
  return std::regex_match(id.begin(), id.end(), kDtmi);
}

ObjectModel DtdlModelParser::Parse(const std::vector<std::string>& documents, const ModelResolver& resolver) const {
  ParseSession session(resolver);
  try {
    return session.Run(documents);
  } catch (const Json::exception& e) {
    throw util::ModelParsingError({std::string("Malformed interface definition: ") + e.what()});
  }
}

} // namespace twingraph::dtdl
