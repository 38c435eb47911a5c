#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/table.hpp"

namespace annoschema::ddl {

enum class Dialect {
  kPostgres,
  kSqlite,
};

std::optional<Dialect> ParseDialect(std::string_view name);

/*
  Renders compiled tables as SQL text for a storage engine to execute.
  Nothing here touches a database.
*/

std::string SqlType(const model::ColumnSpec& column, Dialect dialect);

std::string RenderCreateTable(const model::TableDefinition& table, Dialect dialect);

// one statement per indexed column; geometry columns get a spatial index
std::vector<std::string> RenderCreateIndexes(const model::TableDefinition& table, Dialect dialect);

} // namespace annoschema::ddl
