#pragma once

#include <memory>
#include <string>

#include "internal/graph/graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/twins/limits.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace twingraph::twins {

using util::Json;

/*
  ComponentService

  A component is a named object on a twin whose schema is another
  interface. Updates patch only that object and are written as
  targeted property mutations, conditional on the twin's etag.
*/
class ComponentService {
 public:
  ComponentService(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<models::ModelRegistry> registry,
                   EntityLimits limits = {}, util::ClockFn clock = util::Now);

  Json Get(const std::string& twin_id, const std::string& component);

  // JSON Patch relative to the component object; returns the updated component.
  Json Update(const std::string& twin_id, const std::string& component, const Json& patch,
              const std::string& if_match = {});

 private:
  struct ComponentModel {
    models::ResolvedInterface  resolved;
    const dtdl::InterfaceInfo* schema = nullptr;
  };

  ComponentModel ResolveComponent(const Json& twin, const std::string& component);

  bool TryUpdate(const std::string& twin_id, const std::string& component, const Json& patch,
                 const std::string& if_match, Json& stored);

  std::shared_ptr<graph::GraphStore>     store_;
  std::shared_ptr<models::ModelRegistry> registry_;
  EntityLimits                           limits_;
  util::ClockFn                          clock_;
};

} // namespace twingraph::twins
