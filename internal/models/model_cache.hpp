#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/dtdl/object_model.hpp"
#include "internal/models/model_data.hpp"
#include "internal/util/time.hpp"

namespace twingraph::models {

// A parsed model together with the object model that owns it, so
// component interfaces defined inline stay reachable.
struct ResolvedInterface {
  std::shared_ptr<const dtdl::ObjectModel> object_model;
  const dtdl::InterfaceInfo*               info = nullptr;

  const dtdl::InterfaceInfo* Find(const std::string& id) const {
    return object_model ? object_model->Find(id) : nullptr;
  }
};

/*
  ModelCache

  TTL cache owned by one ModelRegistry.

  Three keyspaces:
    model id -> ModelData
    model id -> ResolvedInterface
    twin id  -> model id

  Entries expire ttl after they were written, measured on the injected
  clock. A zero ttl disables the cache: puts are dropped and every get
  misses. Every kSweepInterval puts, expired entries are erased from all
  keyspaces.
*/
class ModelCache {
 public:
  static constexpr std::size_t kSweepInterval = 256;

  explicit ModelCache(std::chrono::milliseconds ttl, util::ClockFn clock = util::Now);

  bool Enabled() const {
    return ttl_.count() > 0;
  }

  std::optional<ModelData> GetModel(const std::string& id) const;
  void                     PutModel(const ModelData& data);

  std::optional<ResolvedInterface> GetInterface(const std::string& id) const;
  void                             PutInterface(const std::string& id, ResolvedInterface resolved);

  std::optional<std::string> GetTwinModel(const std::string& twin_id) const;
  void                       PutTwinModel(const std::string& twin_id, const std::string& model_id);

  void RemoveModel(const std::string& id);
  void RemoveTwin(const std::string& twin_id);
  void Clear();

  // Entries held across all keyspaces, expired ones included.
  std::size_t Size() const;

 private:
  template <typename T>
  struct Entry {
    T               value;
    util::TimePoint expires_at;
  };

  template <typename T>
  std::optional<T> Lookup(const std::unordered_map<std::string, Entry<T>>& map, const std::string& key) const;

  // Caller holds the unique lock.
  void NoteWrite();

  std::chrono::milliseconds ttl_;
  util::ClockFn             clock_;

  mutable std::shared_mutex                                    mutex_;
  std::unordered_map<std::string, Entry<ModelData>>            models_;
  std::unordered_map<std::string, Entry<ResolvedInterface>>    interfaces_;
  std::unordered_map<std::string, Entry<std::string>>          twin_models_;
  std::size_t                                                  writes_since_sweep_ = 0;
};

} // namespace twingraph::models
