#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/dtdl/model_parser.hpp"
#include "internal/graph/age/age_graph_store.hpp"
#include "internal/graph/age/age_pool.hpp"
#include "internal/graph/age/graph_initialization.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/models/model_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_service.hpp"
#include "internal/twins/component_service.hpp"
#include "internal/twins/digital_twin_service.hpp"
#include "internal/twins/relationship_service.hpp"

namespace twingraph::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kDefaultMaxConnections = 16;
constexpr const char* kDefaultGraphName      = "digitaltwins";

std::string GraphName(const twingraph::runtime::config::RuntimeConfig& config) {
  return config.graph().name().empty() ? kDefaultGraphName : config.graph().name();
}

std::shared_ptr<graph::GraphStore> BuildStore(const twingraph::runtime::config::RuntimeConfig& config) {
  const auto& database   = config.database();
  const auto  graph_name = GraphName(config);

  if (database.has_postgres()) {
    const auto& postgres = database.postgres();
    if (postgres.conninfo().empty()) {
      throw std::runtime_error("database.postgres.conninfo is required");
    }

    const std::size_t max_connections =
        postgres.max_connections() > 0 ? postgres.max_connections() : kDefaultMaxConnections;

    auto primary =
        std::make_shared<graph::age::AgePool>(postgres.conninfo(), max_connections, postgres.statement_timeout_ms());

    std::shared_ptr<graph::age::AgePool> replica;
    if (!postgres.replica_conninfo().empty()) {
      replica = std::make_shared<graph::age::AgePool>(postgres.replica_conninfo(), max_connections,
                                                      postgres.statement_timeout_ms());
    }

    if (config.graph().initialize()) {
      auto       conn    = primary->Acquire();
      const bool created = graph::age::InitializeGraph(*conn, graph_name);
      TWINGRAPH_LOG_INFO("graph initialized", {StringField("graph", graph_name), BoolField("created", created)});
    }

    TWINGRAPH_LOG_INFO("using AGE graph store", {StringField("graph", graph_name),
                                                 BoolField("replica", replica != nullptr),
                                                 IntField("max_connections", static_cast<std::int64_t>(max_connections))});
    return std::make_shared<graph::age::AgeGraphStore>(std::move(primary), std::move(replica), graph_name);
  }

  TWINGRAPH_LOG_INFO("using in-memory graph store");
  return std::make_shared<graph::memory::MemoryGraphStore>();
}

} // namespace

std::shared_ptr<client::TwinGraphClient> BuildClient(const twingraph::runtime::config::RuntimeConfig& config) {
  return BuildClient(config, BuildStore(config));
}

/*
    Wire services over one store
*/
std::shared_ptr<client::TwinGraphClient> BuildClient(const twingraph::runtime::config::RuntimeConfig& config,
                                                     std::shared_ptr<graph::GraphStore>               store) {
  if (!store) {
    throw std::invalid_argument("BuildClient requires a graph store");
  }

  twins::EntityLimits limits;
  if (config.limits().max_batch_relationships() > 0) {
    limits.max_batch_relationships = config.limits().max_batch_relationships();
  }
  if (config.limits().max_update_retries() > 0) {
    limits.max_update_retries = config.limits().max_update_retries();
  }

  const auto ttl = std::chrono::milliseconds(config.model_cache().has_ttl_ms() ? config.model_cache().ttl_ms() : 10000);

  // ------------------------------------------------------------------
  // Models
  // ------------------------------------------------------------------
  auto parser   = std::make_shared<const dtdl::DtdlModelParser>();
  auto registry = std::make_shared<models::ModelRegistry>(store, parser, ttl);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  client::ServiceContext ctx;
  ctx.store         = store;
  ctx.models        = registry;
  ctx.twins         = std::make_shared<twins::DigitalTwinService>(store, registry, limits);
  ctx.relationships = std::make_shared<twins::RelationshipService>(store, registry, limits);
  ctx.components    = std::make_shared<twins::ComponentService>(store, registry, limits);
  ctx.query         = std::make_shared<query::QueryService>(store, GraphName(config));

  return std::make_shared<client::TwinGraphClient>(std::move(ctx));
}

} // namespace twingraph::factory
