#pragma once

#include <map>
#include <shared_mutex>

#include "schema_registry.hpp"

namespace annoschema::registry {

class MemorySchemaRegistry : public SchemaRegistry {
 public:
  // Replaces any schema already registered under the same name.
  void Register(model::Schema schema);

  std::shared_ptr<const model::Schema> Lookup(const std::string& name) const override;

  std::set<std::string> ValidNames() const override;

 private:
  mutable std::shared_mutex mutex_;

  std::map<std::string, std::shared_ptr<const model::Schema>> schemas_;
};

} // namespace annoschema::registry
