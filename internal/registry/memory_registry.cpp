#include "memory_registry.hpp"

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace annoschema::registry {

void MemorySchemaRegistry::Register(model::Schema schema) {
  auto name   = schema.name;
  auto shared = std::make_shared<const model::Schema>(std::move(schema));

  std::unique_lock lock(mutex_);
  schemas_[name] = std::move(shared);
}

std::shared_ptr<const model::Schema> MemorySchemaRegistry::Lookup(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = schemas_.find(name);
  if (it == schemas_.end()) {
    throw util::NotFound("schema not registered: " + name);
  }
  return it->second;
}

std::set<std::string> MemorySchemaRegistry::ValidNames() const {
  std::shared_lock lock(mutex_);

  std::set<std::string> names;
  for (const auto& [name, schema] : schemas_) {
    names.insert(name);
  }
  return names;
}

} // namespace annoschema::registry
