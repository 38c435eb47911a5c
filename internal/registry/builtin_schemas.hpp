#pragma once

#include "internal/model/field.hpp"
#include "memory_registry.hpp"

namespace annoschema::registry {

/*
  Built-in annotation schemas.

  Points are nested records: "position" is a POINTZ geometry, and a
  bound point also carries the supervoxel and root entity it sits on.
*/

model::FieldDescriptor SpatialPoint(bool indexed = false);
model::FieldDescriptor BoundSpatialPoint(bool indexed = false);

model::Schema SynapseSchema();
model::Schema BoundTagSchema();
model::Schema CellTypeLocalSchema();
model::Schema PresynapticBoutonTypeSchema();
model::Schema PostsynapticCompartmentSchema();

// adjacency between two root entities; assembled under "contact"
model::Schema ContactSchema();

void RegisterBuiltinSchemas(MemorySchemaRegistry& registry);

} // namespace annoschema::registry
