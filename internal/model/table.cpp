#include "internal/model/table.hpp"

#include <stdexcept>
#include <tuple>

namespace annoschema::model {

std::string_view ColumnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::kNumeric: return "numeric";
    case ColumnType::kInteger: return "integer";
    case ColumnType::kFloat: return "float";
    case ColumnType::kString: return "string";
    case ColumnType::kBoolean: return "boolean";
    case ColumnType::kGeometry: return "geometry";
  }
  return "unknown";
}

bool operator==(const ColumnSpec& a, const ColumnSpec& b) {
  return std::tie(a.name, a.type, a.indexed, a.primary_key, a.autoincrement, a.foreign_key, a.geometry_tag,
                  a.geometry_dimension) ==
         std::tie(b.name, b.type, b.indexed, b.primary_key, b.autoincrement, b.foreign_key, b.geometry_tag,
                  b.geometry_dimension);
}

bool operator!=(const ColumnSpec& a, const ColumnSpec& b) {
  return !(a == b);
}

const ColumnSpec& TableDefinition::PrimaryKey() const {
  if (columns.empty() || !columns.front().primary_key) {
    throw std::runtime_error("table " + table_name + " has no primary key");
  }
  return columns.front();
}

const ColumnSpec* TableDefinition::FindColumn(std::string_view name) const {
  for (const auto& column : columns) {
    if (column.name == name) return &column;
  }
  return nullptr;
}

std::vector<const ColumnSpec*> TableDefinition::ForeignKeys() const {
  std::vector<const ColumnSpec*> out;
  for (const auto& column : columns) {
    if (column.foreign_key) out.push_back(&column);
  }
  return out;
}

bool operator==(const TableDefinition& a, const TableDefinition& b) {
  return std::tie(a.table_name, a.model_name, a.dataset, a.logical_name, a.version, a.columns, a.concrete,
                  a.polymorphic_identity) ==
         std::tie(b.table_name, b.model_name, b.dataset, b.logical_name, b.version, b.columns, b.concrete,
                  b.polymorphic_identity);
}

bool operator!=(const TableDefinition& a, const TableDefinition& b) {
  return !(a == b);
}

ColumnSpec PrimaryKeyColumn() {
  ColumnSpec id;
  id.name          = "id";
  id.type          = ColumnType::kNumeric;
  id.primary_key   = true;
  id.autoincrement = false;
  return id;
}

} // namespace annoschema::model
