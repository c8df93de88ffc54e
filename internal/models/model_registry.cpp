#include "internal/models/model_registry.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace twingraph::models {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kExtendsLabel      = "_extends";
constexpr const char* kHasComponentLabel = "_hasComponent";

void ThrowOnError(const graph::Result& result, const std::string& model_id) {
  switch (result.code) {
    case graph::ErrorCode::OK:
      return;
    case graph::ErrorCode::NotFound:
      throw util::ModelNotFound("Model with ID " + model_id + " not found");
    case graph::ErrorCode::AlreadyExists:
      throw util::ModelAlreadyExists(result.message.empty() ? "Model with ID " + model_id + " already exists"
                                                            : result.message);
    case graph::ErrorCode::ConstraintViolation:
      throw util::ReferentialIntegrityError("Model " + model_id +
                                            " is referenced by other models and cannot be deleted");
    default:
      throw std::runtime_error("graph store failure for model " + model_id + ": " + result.message);
  }
}

// Submitted documents may hold one interface or an array of them; each
// top-level interface becomes its own stored model.
std::vector<Json> SplitDefinitions(const std::vector<std::string>& documents) {
  std::vector<Json> definitions;
  for (const auto& document : documents) {
    Json parsed;
    try {
      parsed = Json::parse(document);
    } catch (const Json::parse_error& e) {
      throw util::ModelParsingError({std::string("Invalid JSON document: ") + e.what()});
    }
    if (parsed.is_array()) {
      for (auto& element : parsed) definitions.push_back(std::move(element));
    } else {
      definitions.push_back(std::move(parsed));
    }
  }
  return definitions;
}

} // namespace

std::vector<std::string> ComputeBases(const dtdl::ObjectModel& model, const std::string& id) {
  std::vector<std::string> bases;
  std::set<std::string>    visited{id};

  std::vector<std::pair<const dtdl::InterfaceInfo*, std::size_t>> stack;
  if (const auto* root = model.Find(id)) stack.emplace_back(root, 0);

  while (!stack.empty()) {
    auto& frame = stack.back();
    if (frame.second >= frame.first->extends.size()) {
      stack.pop_back();
      continue;
    }

    const auto base_id = frame.first->extends[frame.second++];
    if (!visited.insert(base_id).second) continue;

    bases.push_back(base_id);
    if (const auto* base = model.Find(base_id)) stack.emplace_back(base, 0);
  }
  return bases;
}

ModelRegistry::ModelRegistry(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<const dtdl::ModelParser> parser,
                             std::chrono::milliseconds cache_ttl, util::ClockFn clock)
    : store_(std::move(store)),
      parser_(std::move(parser)),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)),
      cache_(cache_ttl, clock_) {
}

std::vector<std::string> ModelRegistry::FetchDefinitions(const std::vector<std::string>& ids) {
  std::vector<std::string> documents;
  for (const auto& id : ids) {
    try {
      auto data = GetModel(id);
      if (data.model) documents.push_back(data.model->dump());
    } catch (const util::ModelNotFound&) {
      // the parser reports the unresolved reference with its context
    }
  }
  return documents;
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

std::vector<ModelData> ModelRegistry::CreateModels(const std::vector<std::string>& documents) {
  if (documents.empty()) {
    throw util::InvalidArgument("At least one model definition is required");
  }

  const auto definitions = SplitDefinitions(documents);

  std::set<std::string> batch_ids;
  for (const auto& definition : definitions) {
    if (!definition.is_object() || !definition.contains("@id") || !definition["@id"].is_string()) continue;
    const auto id = definition["@id"].get<std::string>();
    if (!batch_ids.insert(id).second) {
      throw util::ModelAlreadyExists("Model with ID " + id + " is defined more than once in the request");
    }
  }

  std::vector<std::string> texts;
  texts.reserve(definitions.size());
  for (const auto& definition : definitions) texts.push_back(definition.dump());

  std::set<std::string> resolved_ids;
  auto                  resolver = [this, &resolved_ids](const std::vector<std::string>& ids) {
    resolved_ids.insert(ids.begin(), ids.end());
    return FetchDefinitions(ids);
  };
  const auto object_model = std::make_shared<const dtdl::ObjectModel>(parser_->Parse(texts, resolver));

  const auto             upload_time = util::ToIso8601(clock_());
  std::vector<ModelData> created;
  std::vector<Json>      records;
  for (const auto& definition : definitions) {
    auto data  = ModelData::FromDefinition(definition, upload_time);
    data.bases = ComputeBases(*object_model, data.id);
    records.push_back(data.ToJson());
    created.push_back(std::move(data));
  }

  ThrowOnError(store_->InsertModels(records), created.front().id);

  // dependency edges only between stored models; inline interfaces have no vertex
  auto is_stored = [&](const std::string& id) {
    return batch_ids.count(id) > 0 || resolved_ids.count(id) > 0;
  };

  std::size_t edges = 0;
  for (const auto& data : created) {
    const auto* info = object_model->Find(data.id);
    if (info == nullptr) continue;

    for (const auto& base : info->extends) {
      if (!is_stored(base)) continue;
      ThrowOnError(store_->AddModelEdge(data.id, base, kExtendsLabel), data.id);
      ++edges;
    }

    std::set<std::string> components;
    for (const auto& [name, content] : info->contents) {
      if (content.kind != dtdl::ContentKind::Component || content.defined_in != data.id) continue;
      if (!is_stored(content.component_schema) || !components.insert(content.component_schema).second) continue;
      ThrowOnError(store_->AddModelEdge(data.id, content.component_schema, kHasComponentLabel), data.id);
      ++edges;
    }
  }

  std::set<std::string> relationship_names;
  for (const auto& [id, info] : object_model->interfaces) {
    for (const auto& [name, content] : info.contents) {
      if (content.kind == dtdl::ContentKind::Relationship) relationship_names.insert(name);
    }
  }
  for (const auto& name : relationship_names) {
    const auto result = store_->EnsureEdgeLabel(name);
    if (!result) {
      throw std::runtime_error("failed to register relationship label " + name + ": " + result.message);
    }
  }

  for (const auto& data : created) {
    cache_.PutModel(data);
  }

  TWINGRAPH_LOG_INFO("models created",
                     {IntField("models", static_cast<std::int64_t>(created.size())),
                      IntField("dependency_edges", static_cast<std::int64_t>(edges)),
                      IntField("relationship_labels", static_cast<std::int64_t>(relationship_names.size()))});
  return created;
}

// ------------------------------------------------------------
// Read
// ------------------------------------------------------------

ModelData ModelRegistry::GetModel(const std::string& id) {
  if (auto cached = cache_.GetModel(id)) {
    return std::move(*cached);
  }

  auto stored = store_->GetModel(id);
  if (!stored) {
    throw util::ModelNotFound("Model with ID " + id + " not found");
  }

  auto data = ModelData::FromJson(*stored);
  cache_.PutModel(data);
  return data;
}

std::vector<ModelData> ModelRegistry::GetModels(const GetModelsOptions& options) {
  std::vector<ModelData> out;
  for (const auto& stored : store_->ListModels(options.dependencies_for)) {
    auto data = ModelData::FromJson(stored);
    if (!options.include_model_definition) data.model.reset();
    out.push_back(std::move(data));
  }
  return out;
}

bool ModelRegistry::IsOfModel(const std::string& candidate_id, const std::string& target_id, bool exact) {
  if (candidate_id == target_id) return true;
  if (exact) return false;

  const auto data = GetModel(candidate_id);
  return std::find(data.bases.begin(), data.bases.end(), target_id) != data.bases.end();
}

ResolvedInterface ModelRegistry::ResolveInterface(const std::string& model_id) {
  if (auto cached = cache_.GetInterface(model_id)) {
    return std::move(*cached);
  }

  const auto data = GetModel(model_id);
  if (!data.model) {
    throw util::ModelNotFound("Model with ID " + model_id + " has no stored definition");
  }

  auto resolver = [this](const std::vector<std::string>& ids) { return FetchDefinitions(ids); };

  ResolvedInterface resolved;
  resolved.object_model = std::make_shared<const dtdl::ObjectModel>(parser_->Parse({data.model->dump()}, resolver));
  resolved.info         = resolved.object_model->Find(model_id);
  if (resolved.info == nullptr) {
    throw util::ModelNotFound(model_id + " or one of its dependencies does not exist.");
  }

  cache_.PutInterface(model_id, resolved);
  return resolved;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void ModelRegistry::DeleteModel(const std::string& id) {
  ThrowOnError(store_->DeleteModel(id), id);
  cache_.RemoveModel(id);
  TWINGRAPH_LOG_INFO("model deleted", {StringField("model_id", id)});
}

void ModelRegistry::DeleteAllModels() {
  const auto result = store_->DeleteAllModels();
  if (result.code == graph::ErrorCode::NotFound) {
    throw util::ModelNotFound("No models found");
  }
  ThrowOnError(result, "*");
  cache_.Clear();
  TWINGRAPH_LOG_INFO("all models deleted");
}

// ------------------------------------------------------------
// Twin -> model
// ------------------------------------------------------------

std::string ModelRegistry::GetTwinModelId(const std::string& twin_id) {
  if (auto cached = cache_.GetTwinModel(twin_id)) {
    return std::move(*cached);
  }

  const auto twin = store_->GetTwin(twin_id);
  if (!twin) {
    throw util::TwinNotFound("Digital Twin with ID " + twin_id + " not found");
  }

  const auto& metadata = twin->contains("$metadata") ? (*twin)["$metadata"] : Json();
  if (!metadata.is_object() || !metadata.contains("$model") || !metadata["$model"].is_string()) {
    throw util::ValidationFailed("Digital Twin " + twin_id + " has no $metadata.$model");
  }

  auto model_id = metadata["$model"].get<std::string>();
  cache_.PutTwinModel(twin_id, model_id);
  return model_id;
}

void ModelRegistry::RememberTwinModel(const std::string& twin_id, const std::string& model_id) {
  cache_.PutTwinModel(twin_id, model_id);
}

void ModelRegistry::ForgetTwin(const std::string& twin_id) {
  cache_.RemoveTwin(twin_id);
}

} // namespace twingraph::models
