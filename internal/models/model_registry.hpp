#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/dtdl/model_parser.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/models/model_cache.hpp"
#include "internal/models/model_data.hpp"

namespace twingraph::models {

struct GetModelsOptions {
  // Empty: every model. Otherwise these models plus all of their bases.
  std::vector<std::string> dependencies_for;
  bool                     include_model_definition = false;
};

/*
  ModelRegistry

  Owns model ingestion and lookup on top of a GraphStore.

  - Models are immutable: creating an existing id is ModelAlreadyExists.
  - Each stored model carries "bases", the flattened list of every
    interface it transitively extends, so inheritance checks are an
    array membership test.
  - Lookups go through the registry's own ModelCache.
*/
class ModelRegistry {
 public:
  ModelRegistry(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<const dtdl::ModelParser> parser,
                std::chrono::milliseconds cache_ttl, util::ClockFn clock = util::Now);

  std::vector<ModelData> CreateModels(const std::vector<std::string>& definitions);

  ModelData              GetModel(const std::string& id);
  std::vector<ModelData> GetModels(const GetModelsOptions& options = {});

  void DeleteModel(const std::string& id);
  void DeleteAllModels();

  // candidate == target, or (unless exact) target is one of candidate's bases.
  bool IsOfModel(const std::string& candidate_id, const std::string& target_id, bool exact = false);

  ResolvedInterface ResolveInterface(const std::string& model_id);

  std::string GetTwinModelId(const std::string& twin_id);
  void        RememberTwinModel(const std::string& twin_id, const std::string& model_id);
  void        ForgetTwin(const std::string& twin_id);

  ModelCache& cache() {
    return cache_;
  }

 private:
  // Definitions of already stored models, for references the parser cannot satisfy locally.
  std::vector<std::string> FetchDefinitions(const std::vector<std::string>& ids);

  std::shared_ptr<graph::GraphStore>       store_;
  std::shared_ptr<const dtdl::ModelParser> parser_;
  util::ClockFn                            clock_;
  ModelCache                               cache_;
};

// Every interface `id` transitively extends, depth-first preorder, each once.
std::vector<std::string> ComputeBases(const dtdl::ObjectModel& model, const std::string& id);

} // namespace twingraph::models
