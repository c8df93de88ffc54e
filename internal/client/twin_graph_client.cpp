#include "internal/client/twin_graph_client.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/twins/component_service.hpp"
#include "internal/twins/digital_twin_service.hpp"

namespace twingraph::client {

namespace {

template <typename Fn>
auto ObserveCall(std::string_view operation, std::string_view subject, Fn&& fn) {
  const observability::CallLog call(operation, subject);
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      call.Completed();
      return;
    } else {
      auto result = fn();
      call.Completed();
      return result;
    }
  } catch (const std::exception& ex) {
    call.Failed(ex);
    throw;
  }
}

} // namespace

TwinGraphClient::TwinGraphClient(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.models || !ctx_.twins || !ctx_.relationships || !ctx_.components || !ctx_.query) {
    throw std::invalid_argument("TwinGraphClient requires every service in its context");
  }
}

// ------------------------------------------------------------
// Query
// ------------------------------------------------------------

query::QueryPage TwinGraphClient::Query(const std::string& query, const query::QueryOptions& options) const {
  return ObserveCall("Query", query, [&] { return ctx_.query->Query(query, options); });
}

// ------------------------------------------------------------
// Models
// ------------------------------------------------------------

std::vector<models::ModelData> TwinGraphClient::CreateModels(const std::vector<std::string>& definitions) const {
  return ObserveCall("CreateModels", "", [&] { return ctx_.models->CreateModels(definitions); });
}

models::ModelData TwinGraphClient::GetModel(const std::string& id) const {
  return ObserveCall("GetModel", id, [&] { return ctx_.models->GetModel(id); });
}

std::vector<models::ModelData> TwinGraphClient::GetModels(const models::GetModelsOptions& options) const {
  return ObserveCall("GetModels", "", [&] { return ctx_.models->GetModels(options); });
}

void TwinGraphClient::DeleteModel(const std::string& id) const {
  ObserveCall("DeleteModel", id, [&] { ctx_.models->DeleteModel(id); });
}

void TwinGraphClient::DeleteAllModels() const {
  ObserveCall("DeleteAllModels", "", [&] { ctx_.models->DeleteAllModels(); });
}

// ------------------------------------------------------------
// Digital twins
// ------------------------------------------------------------

bool TwinGraphClient::DigitalTwinExists(const std::string& id) const {
  return ObserveCall("DigitalTwinExists", id, [&] { return ctx_.twins->Exists(id); });
}

Json TwinGraphClient::GetDigitalTwin(const std::string& id) const {
  return ObserveCall("GetDigitalTwin", id, [&] { return ctx_.twins->Get(id); });
}

Json TwinGraphClient::CreateOrReplaceDigitalTwin(const std::string& id, const Json& twin,
                                                 const std::string& if_none_match) const {
  return ObserveCall("CreateOrReplaceDigitalTwin", id,
                     [&] { return ctx_.twins->CreateOrReplace(id, twin, if_none_match); });
}

Json TwinGraphClient::UpdateDigitalTwin(const std::string& id, const Json& patch, const std::string& if_match) const {
  return ObserveCall("UpdateDigitalTwin", id, [&] { return ctx_.twins->Update(id, patch, if_match); });
}

void TwinGraphClient::DeleteDigitalTwin(const std::string& id) const {
  ObserveCall("DeleteDigitalTwin", id, [&] { ctx_.twins->Delete(id); });
}

// ------------------------------------------------------------
// Relationships
// ------------------------------------------------------------

Json TwinGraphClient::GetRelationship(const std::string& source_id, const std::string& relationship_id) const {
  return ObserveCall("GetRelationship", source_id,
                     [&] { return ctx_.relationships->Get(source_id, relationship_id); });
}

std::vector<Json> TwinGraphClient::GetRelationships(const std::string&                source_id,
                                                    const std::optional<std::string>& relationship_name) const {
  return ObserveCall("GetRelationships", source_id,
                     [&] { return ctx_.relationships->List(source_id, relationship_name); });
}

std::vector<Json> TwinGraphClient::GetIncomingRelationships(const std::string& target_id) const {
  return ObserveCall("GetIncomingRelationships", target_id,
                     [&] { return ctx_.relationships->ListIncoming(target_id); });
}

Json TwinGraphClient::CreateOrReplaceRelationship(const std::string& source_id, const std::string& relationship_id,
                                                  const Json& relationship, const std::string& if_none_match) const {
  return ObserveCall("CreateOrReplaceRelationship", source_id, [&] {
    return ctx_.relationships->CreateOrReplace(source_id, relationship_id, relationship, if_none_match);
  });
}

Json TwinGraphClient::UpdateRelationship(const std::string& source_id, const std::string& relationship_id,
                                         const Json& patch, const std::string& if_match) const {
  return ObserveCall("UpdateRelationship", source_id,
                     [&] { return ctx_.relationships->Update(source_id, relationship_id, patch, if_match); });
}

void TwinGraphClient::DeleteRelationship(const std::string& source_id, const std::string& relationship_id) const {
  ObserveCall("DeleteRelationship", source_id, [&] { ctx_.relationships->Delete(source_id, relationship_id); });
}

twins::BatchRelationshipResult TwinGraphClient::CreateOrReplaceRelationships(
    const std::vector<Json>& relationships) const {
  return ObserveCall("CreateOrReplaceRelationships", "",
                     [&] { return ctx_.relationships->CreateOrReplaceMany(relationships); });
}

// ------------------------------------------------------------
// Components
// ------------------------------------------------------------

Json TwinGraphClient::GetComponent(const std::string& twin_id, const std::string& component) const {
  return ObserveCall("GetComponent", twin_id, [&] { return ctx_.components->Get(twin_id, component); });
}

Json TwinGraphClient::UpdateComponent(const std::string& twin_id, const std::string& component, const Json& patch,
                                      const std::string& if_match) const {
  return ObserveCall("UpdateComponent", twin_id,
                     [&] { return ctx_.components->Update(twin_id, component, patch, if_match); });
}

} // namespace twingraph::client
