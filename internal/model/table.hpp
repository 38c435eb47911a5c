#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace annoschema::model {

using Version = std::uint32_t;

enum class ColumnType {
  kNumeric,
  kInteger,
  kFloat,
  kString,
  kBoolean,
  kGeometry,
};

std::string_view ColumnTypeName(ColumnType type);

struct ColumnSpec {
  std::string name;
  ColumnType  type = ColumnType::kNumeric;

  bool indexed       = false;
  bool primary_key   = false;
  bool autoincrement = false;

  // "table.column"
  std::optional<std::string> foreign_key;

  // geometry columns only; opaque to the compiler
  std::string   geometry_tag;
  std::uint32_t geometry_dimension = 0;
};

bool operator==(const ColumnSpec& a, const ColumnSpec& b);
bool operator!=(const ColumnSpec& a, const ColumnSpec& b);

/*
  TableDefinition

  Compiled, storage-ready description of one table. The primary key
  "id" is always columns.front(); ids are assigned externally.
*/
struct TableDefinition {
  std::string table_name;
  std::string model_name;

  std::string dataset;
  std::string logical_name;
  Version     version = 0;

  std::vector<ColumnSpec> columns;

  // annotation tables never share a polymorphic identity across datasets
  bool        concrete = false;
  std::string polymorphic_identity;

  const ColumnSpec& PrimaryKey() const;
  const ColumnSpec* FindColumn(std::string_view name) const;
  std::vector<const ColumnSpec*> ForeignKeys() const;
};

bool operator==(const TableDefinition& a, const TableDefinition& b);
bool operator!=(const TableDefinition& a, const TableDefinition& b);

ColumnSpec PrimaryKeyColumn();

} // namespace annoschema::model
