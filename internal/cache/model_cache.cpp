#include "model_cache.hpp"

#include <mutex>
#include <utility>

#include "internal/naming/table_name.hpp"
#include "internal/observability/logging.hpp"

namespace annoschema::cache {

std::string ModelCache::Key(std::string_view dataset, std::string_view table_name, model::Version version) {
  return naming::EncodeTableName(dataset, table_name, version);
}

// ------------------------------------------------------------
// GetOrCompile
// ------------------------------------------------------------

ModelPtr ModelCache::GetOrCompile(std::string_view dataset, std::string_view table_name, model::Version version,
                                  const CompileFn& compile) {
  const auto key = Key(dataset, table_name, version);

  {
    std::shared_lock lock(mutex_);
    auto             it = models_.find(key);
    if (it != models_.end()) {
      ANNOSCHEMA_LOG_DEBUG("Model cache hit", {observability::StringField("table", key)});
      return it->second;
    }
  }

  {
    std::unique_lock lock(mutex_);
    for (;;) {
      auto it = models_.find(key);
      if (it != models_.end()) return it->second;
      if (in_flight_.count(key) == 0) break;
      compiled_.wait(lock);
    }
    in_flight_.insert(key);
  }

  model::TableDefinition table;
  try {
    table = compile();
  } catch (...) {
    {
      std::unique_lock lock(mutex_);
      in_flight_.erase(key);
    }
    compiled_.notify_all();
    throw;
  }

  auto model = std::make_shared<const model::TableDefinition>(std::move(table));
  {
    std::unique_lock lock(mutex_);
    models_.emplace(key, model);
    in_flight_.erase(key);
  }
  compiled_.notify_all();
  return model;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<ModelPtr> ModelCache::Get(std::string_view dataset, std::string_view table_name,
                                        model::Version version) const {
  std::shared_lock lock(mutex_);

  auto it = models_.find(Key(dataset, table_name, version));
  if (it == models_.end()) return std::nullopt;

  return it->second;
}

bool ModelCache::Contains(std::string_view dataset, std::string_view table_name, model::Version version) const {
  std::shared_lock lock(mutex_);
  return models_.count(Key(dataset, table_name, version)) > 0;
}

std::size_t ModelCache::Size() const {
  std::shared_lock lock(mutex_);
  return models_.size();
}

} // namespace annoschema::cache
