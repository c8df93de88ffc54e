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
  DigitalTwinService

  Twin lifecycle on top of GraphStore.

  - Every write validates against the twin's model (directly declared
    or inherited contents) and aggregates all violations.
  - Every successful write stamps $metadata.$lastUpdateTime and
    issues a new $etag.
  - Updates are read-modify-write closed by a conditional write on the
    etag that was read.
*/
class DigitalTwinService {
 public:
  DigitalTwinService(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<models::ModelRegistry> registry,
                     EntityLimits limits = {}, util::ClockFn clock = util::Now);

  bool Exists(const std::string& id);

  Json Get(const std::string& id);

  // if_none_match: empty or "*".
  Json CreateOrReplace(const std::string& id, const Json& twin, const std::string& if_none_match = {});

  // JSON Patch; if_match: empty, "*" or an etag.
  Json Update(const std::string& id, const Json& patch, const std::string& if_match = {});

  void Delete(const std::string& id);

 private:
  models::ResolvedInterface ResolveModel(const std::string& model_id);

  // One read-modify-write attempt; false when another writer won the race.
  bool TryUpdate(const std::string& id, const Json& patch, const std::string& if_match, Json& stored);

  std::shared_ptr<graph::GraphStore>     store_;
  std::shared_ptr<models::ModelRegistry> registry_;
  EntityLimits                           limits_;
  util::ClockFn                          clock_;
};

} // namespace twingraph::twins
