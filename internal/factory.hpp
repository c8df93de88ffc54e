#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/client/twin_graph_client.hpp"

namespace twingraph::factory {

/*
  BuildClient

  Constructs the whole library stack from runtime config: graph store
  (memory or AGE), model registry with its cache, entity services,
  query service and the client facade over them.

  NOTE:
  This is the composition root.
  It is the ONLY place allowed to know concrete store types.
*/
std::shared_ptr<client::TwinGraphClient> BuildClient(const twingraph::runtime::config::RuntimeConfig& config);

// Same wiring over a caller-supplied store (tests, embedding).
std::shared_ptr<client::TwinGraphClient> BuildClient(const twingraph::runtime::config::RuntimeConfig& config,
                                                     std::shared_ptr<graph::GraphStore>               store);

} // namespace twingraph::factory
