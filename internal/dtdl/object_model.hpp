#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/json.hpp"

namespace twingraph::dtdl {

using util::Json;

enum class SchemaKind {
  Boolean,
  Date,
  DateTime,
  Double,
  Duration,
  Float,
  Integer,
  Long,
  String,
  Time,
  Object,
  Enum,
  Map,
  Array
};

std::string_view ToString(SchemaKind kind);

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

struct SchemaField {
  std::string name;
  SchemaPtr   schema;
};

struct EnumValue {
  std::string name;
  Json        value;
};

struct Schema {
  SchemaKind  kind = SchemaKind::String;
  std::string id;

  std::vector<SchemaField> fields;  // Object

  SchemaKind             enum_value_kind = SchemaKind::Integer;  // Enum
  std::vector<EnumValue> enum_values;

  SchemaPtr element;  // Array
  SchemaPtr map_value;  // Map, keys are always strings

  // Human-readable violations, empty when the instance conforms.
  std::vector<std::string> ValidateInstance(const Json& instance) const;
};

enum class ContentKind {
  Property,
  Telemetry,
  Relationship,
  Component,
  Command
};

std::string_view ToString(ContentKind kind);

struct RelationshipProperty {
  std::string name;
  SchemaPtr   schema;
  bool        writable = false;
};

struct ContentInfo {
  ContentKind kind = ContentKind::Property;
  std::string name;
  std::string defined_in;  // interface that declared it

  SchemaPtr schema;  // Property, Telemetry
  bool      writable = false;

  std::string component_schema;  // Component: interface id

  std::string                       target;  // Relationship: optional interface id
  std::optional<int>                min_multiplicity;
  std::optional<int>                max_multiplicity;
  std::vector<RelationshipProperty> properties;
};

struct InterfaceInfo {
  std::string id;
  Json        display_name;  // string or language map, null when absent
  Json        description;

  // Direct bases in declaration order.
  std::vector<std::string> extends;

  // Own and inherited contents keyed by name.
  std::map<std::string, ContentInfo> contents;

  const ContentInfo* FindContent(const std::string& name) const;
};

struct ObjectModel {
  std::map<std::string, InterfaceInfo> interfaces;

  // Top-level interface ids of the submitted documents in submission order.
  std::vector<std::string> roots;

  const InterfaceInfo* Find(const std::string& id) const;
};

} // namespace twingraph::dtdl
