#pragma once

#include <memory>
#include <set>
#include <string>

#include "internal/model/field.hpp"

namespace annoschema::registry {

/*
  Source of schema descriptions, by name.

  Lookup throws util::NotFound for unregistered names.
*/
class SchemaRegistry {
 public:
  virtual ~SchemaRegistry() = default;

  virtual std::shared_ptr<const model::Schema> Lookup(const std::string& name) const = 0;

  virtual std::set<std::string> ValidNames() const = 0;
};

} // namespace annoschema::registry
