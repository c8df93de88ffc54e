#pragma once

#include "config/config.pb.h"

#include "internal/client/twin_graph_client.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace twingraph::v1 {
using ::twingraph::client::TwinGraphClient;
using ::twingraph::config::ConfigLoader;
using ::twingraph::factory::BuildClient;
using ::twingraph::models::GetModelsOptions;
using ::twingraph::models::ModelData;
using ::twingraph::query::QueryOptions;
using ::twingraph::query::QueryPage;
using ::twingraph::runtime::config::RuntimeConfig;
using ::twingraph::twins::BatchRelationshipResult;
using ::twingraph::twins::RelationshipOperationResult;
using ::twingraph::util::Json;
} // namespace twingraph::v1
