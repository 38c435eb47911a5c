#pragma once

#include <optional>

#include "internal/model/field.hpp"
#include "internal/model/table.hpp"

namespace annoschema::compiler {

/*
  Single source of truth for scalar kind -> column type translation.

  Returns nullopt for composite and unmapped kinds; callers decide
  whether that is a nested record or an error.
*/
std::optional<model::ColumnType> ScalarColumnType(model::FieldKind kind);

} // namespace annoschema::compiler
