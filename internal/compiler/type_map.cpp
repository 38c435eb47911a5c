#include "internal/compiler/type_map.hpp"

#include <array>
#include <utility>

namespace annoschema::compiler {

namespace {

using model::ColumnType;
using model::FieldKind;

constexpr std::array<std::pair<FieldKind, ColumnType>, 6> kScalarColumnTypes = {{
    {FieldKind::kNumeric, ColumnType::kNumeric},
    {FieldKind::kInteger, ColumnType::kInteger},
    {FieldKind::kFloat, ColumnType::kFloat},
    {FieldKind::kString, ColumnType::kString},
    {FieldKind::kBoolean, ColumnType::kBoolean},
    // reference values are plain integer ids
    {FieldKind::kReference, ColumnType::kInteger},
}};

} // namespace

std::optional<ColumnType> ScalarColumnType(FieldKind kind) {
  for (const auto& [from, to] : kScalarColumnTypes) {
    if (from == kind) return to;
  }
  return std::nullopt;
}

} // namespace annoschema::compiler
