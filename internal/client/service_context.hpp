#pragma once

#include <memory>

namespace twingraph::graph { class GraphStore; }
namespace twingraph::models { class ModelRegistry; }
namespace twingraph::query { class QueryService; }
namespace twingraph::twins {
class DigitalTwinService;
class RelationshipService;
class ComponentService;
} // namespace twingraph::twins

namespace twingraph::client {

/*
  Dependency container shared by the client facade.
*/
struct ServiceContext {
  std::shared_ptr<twingraph::graph::GraphStore>          store;
  std::shared_ptr<twingraph::models::ModelRegistry>      models;
  std::shared_ptr<twingraph::twins::DigitalTwinService>  twins;
  std::shared_ptr<twingraph::twins::RelationshipService> relationships;
  std::shared_ptr<twingraph::twins::ComponentService>    components;
  std::shared_ptr<twingraph::query::QueryService>        query;
};

} // namespace twingraph::client
