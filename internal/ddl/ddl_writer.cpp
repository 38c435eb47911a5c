#include "ddl_writer.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace annoschema::ddl {

using model::ColumnSpec;
using model::ColumnType;
using model::TableDefinition;

namespace {

// "table.column" -> {"table", "column"}
std::pair<std::string, std::string> SplitForeignKey(const std::string& target) {
  const auto dot = target.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == target.size()) {
    throw std::runtime_error("foreign key target must be table.column: " + target);
  }
  return {target.substr(0, dot), target.substr(dot + 1)};
}

std::string IndexName(const TableDefinition& table, const ColumnSpec& column) {
  return "ix_" + table.table_name + "_" + column.name;
}

} // namespace

std::optional<Dialect> ParseDialect(std::string_view name) {
  if (name.empty() || name == "postgres" || name == "postgresql") return Dialect::kPostgres;
  if (name == "sqlite") return Dialect::kSqlite;
  return std::nullopt;
}

std::string SqlType(const ColumnSpec& column, Dialect dialect) {
  switch (column.type) {
    case ColumnType::kNumeric: return "NUMERIC";
    case ColumnType::kInteger: return "INTEGER";
    case ColumnType::kFloat: return dialect == Dialect::kPostgres ? "FLOAT" : "REAL";
    case ColumnType::kString: return dialect == Dialect::kPostgres ? "VARCHAR" : "TEXT";
    case ColumnType::kBoolean: return "BOOLEAN";
    case ColumnType::kGeometry:
      if (dialect == Dialect::kSqlite) return "BLOB";
      return "geometry(" + column.geometry_tag + ")";
  }
  throw std::runtime_error("unknown column type for " + column.name);
}

std::string RenderCreateTable(const TableDefinition& table, Dialect dialect) {
  std::ostringstream out;
  out << "CREATE TABLE " << table.table_name << " (\n";

  for (const auto& column : table.columns) {
    out << "\t" << column.name << " " << SqlType(column, dialect);
    if (column.primary_key) out << " NOT NULL";
    out << ",\n";
  }

  out << "\tPRIMARY KEY (" << table.PrimaryKey().name << ")";
  for (const auto* column : table.ForeignKeys()) {
    auto [ref_table, ref_column] = SplitForeignKey(*column->foreign_key);
    out << ",\n\tFOREIGN KEY(" << column->name << ") REFERENCES " << ref_table << " (" << ref_column << ")";
  }
  out << "\n);";

  return out.str();
}

std::vector<std::string> RenderCreateIndexes(const TableDefinition& table, Dialect dialect) {
  std::vector<std::string> statements;
  for (const auto& column : table.columns) {
    if (!column.indexed || column.primary_key) continue;

    std::string statement = "CREATE INDEX " + IndexName(table, column) + " ON " + table.table_name;
    if (column.type == ColumnType::kGeometry && dialect == Dialect::kPostgres) {
      statement += " USING GIST (" + column.name + ");";
    } else {
      statement += " (" + column.name + ");";
    }
    statements.push_back(std::move(statement));
  }
  return statements;
}

} // namespace annoschema::ddl
