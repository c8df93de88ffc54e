#include "internal/models/model_cache.hpp"

#include <mutex>

namespace twingraph::models {

ModelCache::ModelCache(std::chrono::milliseconds ttl, util::ClockFn clock)
    : ttl_(ttl.count() < 0 ? std::chrono::milliseconds(0) : ttl), clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
}

template <typename T>
std::optional<T> ModelCache::Lookup(const std::unordered_map<std::string, Entry<T>>& map,
                                    const std::string&                               key) const {
  if (!Enabled()) return std::nullopt;

  std::shared_lock lock(mutex_);
  auto             it = map.find(key);
  if (it == map.end() || clock_() >= it->second.expires_at) return std::nullopt;
  return it->second.value;
}

namespace {

template <typename Map>
void EraseExpired(Map& map, util::TimePoint now) {
  for (auto it = map.begin(); it != map.end();) {
    if (now >= it->second.expires_at) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace

void ModelCache::NoteWrite() {
  if (++writes_since_sweep_ < kSweepInterval) return;
  writes_since_sweep_ = 0;

  const auto now = clock_();
  EraseExpired(models_, now);
  EraseExpired(interfaces_, now);
  EraseExpired(twin_models_, now);
}

// ------------------------------------------------------------
// Models
// ------------------------------------------------------------

std::optional<ModelData> ModelCache::GetModel(const std::string& id) const {
  return Lookup(models_, id);
}

void ModelCache::PutModel(const ModelData& data) {
  if (!Enabled()) return;
  std::unique_lock lock(mutex_);
  models_[data.id] = {data, clock_() + ttl_};
  NoteWrite();
}

// ------------------------------------------------------------
// Parsed interfaces
// ------------------------------------------------------------

std::optional<ResolvedInterface> ModelCache::GetInterface(const std::string& id) const {
  return Lookup(interfaces_, id);
}

void ModelCache::PutInterface(const std::string& id, ResolvedInterface resolved) {
  if (!Enabled()) return;
  std::unique_lock lock(mutex_);
  interfaces_[id] = {std::move(resolved), clock_() + ttl_};
  NoteWrite();
}

// ------------------------------------------------------------
// Twin -> model
// ------------------------------------------------------------

std::optional<std::string> ModelCache::GetTwinModel(const std::string& twin_id) const {
  return Lookup(twin_models_, twin_id);
}

void ModelCache::PutTwinModel(const std::string& twin_id, const std::string& model_id) {
  if (!Enabled()) return;
  std::unique_lock lock(mutex_);
  twin_models_[twin_id] = {model_id, clock_() + ttl_};
  NoteWrite();
}

// ------------------------------------------------------------
// Eviction
// ------------------------------------------------------------

void ModelCache::RemoveModel(const std::string& id) {
  std::unique_lock lock(mutex_);
  models_.erase(id);
  interfaces_.erase(id);
}

void ModelCache::RemoveTwin(const std::string& twin_id) {
  std::unique_lock lock(mutex_);
  twin_models_.erase(twin_id);
}

void ModelCache::Clear() {
  std::unique_lock lock(mutex_);
  models_.clear();
  interfaces_.clear();
  twin_models_.clear();
  writes_since_sweep_ = 0;
}

std::size_t ModelCache::Size() const {
  std::shared_lock lock(mutex_);
  return models_.size() + interfaces_.size() + twin_models_.size();
}

} // namespace twingraph::models
