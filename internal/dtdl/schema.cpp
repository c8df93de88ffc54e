#include "internal/dtdl/object_model.hpp"

#include <cstdint>
#include <limits>
#include <regex>

namespace twingraph::dtdl {
namespace {

const std::regex& DateRegex() {
  static const std::regex kDate(R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])$)");
  return kDate;
}

const std::regex& TimeRegex() {
  static const std::regex kTime(R"(^([01]\d|2[0-3]):[0-5]\d:([0-5]\d|60)(\.\d+)?(Z|[+-]([01]\d|2[0-3]):[0-5]\d)?$)");
  return kTime;
}

const std::regex& DateTimeRegex() {
  static const std::regex kDateTime(
      R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])[Tt]([01]\d|2[0-3]):[0-5]\d:([0-5]\d|60)(\.\d+)?([Zz]|[+-]([01]\d|2[0-3]):[0-5]\d)$)");
  return kDateTime;
}

const std::regex& DurationRegex() {
  static const std::regex kDuration(
      R"(^P(?!$)(\d+Y)?(\d+M)?(\d+W)?(\d+D)?(T(?=\d)(\d+H)?(\d+M)?(\d+(\.\d+)?S)?)?$)");
  return kDuration;
}

std::string Invalid(const Json& instance, SchemaKind kind) {
  return instance.dump() + " is not a valid " + std::string(ToString(kind)) + " value";
}

bool MatchesString(const Json& instance, const std::regex& pattern) {
  return instance.is_string() && std::regex_match(instance.get_ref<const std::string&>(), pattern);
}

bool FitsInt32(const Json& instance) {
  if (instance.is_number_unsigned()) {
    return instance.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
  }
  if (instance.is_number_integer()) {
    const auto value = instance.get<std::int64_t>();
    return value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max();
  }
  return false;
}

bool FitsInt64(const Json& instance) {
  if (instance.is_number_unsigned()) {
    return instance.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  }
  return instance.is_number_integer();
}

void Prefixed(std::vector<std::string>& out, const std::string& prefix, std::vector<std::string> nested) {
  for (auto& violation : nested) {
    out.push_back(prefix + violation);
  }
}

} // namespace

std::string_view ToString(SchemaKind kind) {
  switch (kind) {
    case SchemaKind::Boolean:
      return "boolean";
    case SchemaKind::Date:
      return "date";
    case SchemaKind::DateTime:
      return "dateTime";
    case SchemaKind::Double:
      return "double";
    case SchemaKind::Duration:
      return "duration";
    case SchemaKind::Float:
      return "float";
    case SchemaKind::Integer:
      return "integer";
    case SchemaKind::Long:
      return "long";
    case SchemaKind::String:
      return "string";
    case SchemaKind::Time:
      return "time";
    case SchemaKind::Object:
      return "Object";
    case SchemaKind::Enum:
      return "Enum";
    case SchemaKind::Map:
      return "Map";
    case SchemaKind::Array:
      return "Array";
  }
  return "unknown";
}

std::string_view ToString(ContentKind kind) {
  switch (kind) {
    case ContentKind::Property:
      return "Property";
    case ContentKind::Telemetry:
      return "Telemetry";
    case ContentKind::Relationship:
      return "Relationship";
    case ContentKind::Component:
      return "Component";
    case ContentKind::Command:
      return "Command";
  }
  return "Unknown";
}

std::vector<std::string> Schema::ValidateInstance(const Json& instance) const {
  std::vector<std::string> violations;

  switch (kind) {
    case SchemaKind::Boolean:
      if (!instance.is_boolean()) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Integer:
      if (!FitsInt32(instance)) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Long:
      if (!FitsInt64(instance)) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Double:
    case SchemaKind::Float:
      if (!instance.is_number()) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::String:
      if (!instance.is_string()) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Date:
      if (!MatchesString(instance, DateRegex())) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::DateTime:
      if (!MatchesString(instance, DateTimeRegex())) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Time:
      if (!MatchesString(instance, TimeRegex())) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Duration:
      if (!MatchesString(instance, DurationRegex())) violations.push_back(Invalid(instance, kind));
      break;

    case SchemaKind::Object: {
      if (!instance.is_object()) {
        violations.push_back(Invalid(instance, kind));
        break;
      }
      for (auto it = instance.begin(); it != instance.end(); ++it) {
        const auto&        key   = it.key();
        const SchemaField* field = nullptr;
        for (const auto& candidate : fields) {
          if (candidate.name == key) {
            field = &candidate;
            break;
          }
        }
        if (field == nullptr) {
          violations.push_back("'" + key + "' is not a field of the Object schema");
          continue;
        }
        Prefixed(violations, "field '" + key + "': ", field->schema->ValidateInstance(it.value()));
      }
      break;
    }

    case SchemaKind::Enum: {
      bool found = false;
      for (const auto& candidate : enum_values) {
        if (candidate.value == instance) {
          found = true;
          break;
        }
      }
      if (!found) {
        violations.push_back(instance.dump() + " is not one of the enum values");
      }
      break;
    }

    case SchemaKind::Map: {
      if (!instance.is_object()) {
        violations.push_back(Invalid(instance, kind));
        break;
      }
      for (auto it = instance.begin(); it != instance.end(); ++it) {
        Prefixed(violations, "key '" + it.key() + "': ", map_value->ValidateInstance(it.value()));
      }
      break;
    }

    case SchemaKind::Array: {
      if (!instance.is_array()) {
        violations.push_back(Invalid(instance, kind));
        break;
      }
      for (std::size_t i = 0; i < instance.size(); ++i) {
        Prefixed(violations, "element " + std::to_string(i) + ": ", element->ValidateInstance(instance[i]));
      }
      break;
    }
  }

  return violations;
}

const ContentInfo* InterfaceInfo::FindContent(const std::string& name) const {
  auto it = contents.find(name);
  return it == contents.end() ? nullptr : &it->second;
}

const InterfaceInfo* ObjectModel::Find(const std::string& id) const {
  auto it = interfaces.find(id);
  return it == interfaces.end() ? nullptr : &it->second;
}

} // namespace twingraph::dtdl
