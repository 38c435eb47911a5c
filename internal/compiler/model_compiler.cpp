#include "model_compiler.hpp"

#include <utility>

#include "internal/naming/table_name.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace annoschema::compiler {

using model::ColumnSpec;
using model::ColumnType;
using model::TableDefinition;

namespace {

constexpr const char* kTargetIdField = "target_id";
constexpr const char* kDefaultRootTable = "cellsegment";
constexpr const char* kDefaultRootModel = "CellSegment";

} // namespace

ModelCompiler::ModelCompiler(CompilerOptions options) : options_(options), flattener_(std::move(options)) {
}

TableDefinition ModelCompiler::Compile(const std::string& dataset, const std::string& table_name,
                                       const model::Schema& schema, model::Version version) const {
  TableDefinition table;
  table.table_name   = naming::EncodeTableName(dataset, table_name, version);
  table.model_name   = naming::Capitalize(dataset) + naming::Capitalize(table_name);
  table.dataset      = dataset;
  table.logical_name = table_name;
  table.version      = version;
  table.columns.push_back(model::PrimaryKeyColumn());

  for (const auto& field : schema.fields) {
    if (field.descriptor.drop_column) continue;

    auto columns = flattener_.Flatten(field.name, field.descriptor, dataset, version);
    for (auto& column : columns) {
      table.columns.push_back(std::move(column));
    }
  }

  if (schema.IsReference()) {
    AddReferenceColumn(table, schema);
  }

  table.concrete             = true;
  table.polymorphic_identity = dataset;

  ANNOSCHEMA_LOG_DEBUG("Compiled table",
                       {observability::StringField("table", table.table_name),
                        observability::StringField("schema", schema.name),
                        observability::IntField("columns", static_cast<std::int64_t>(table.columns.size()))});
  return table;
}

TableDefinition ModelCompiler::CompileRoot(const std::string& dataset, model::Version version) const {
  TableDefinition table;
  table.table_name   = naming::EncodeTableName(dataset, options_.root_table_name, version);
  table.model_name   = naming::Capitalize(dataset) + (options_.root_table_name == kDefaultRootTable
                                                           ? std::string(kDefaultRootModel)
                                                           : naming::Capitalize(options_.root_table_name));
  table.dataset      = dataset;
  table.logical_name = options_.root_table_name;
  table.version      = version;
  table.columns.push_back(model::PrimaryKeyColumn());

  ANNOSCHEMA_LOG_DEBUG("Compiled root table", {observability::StringField("table", table.table_name)});
  return table;
}

// The reference foreign key replaces a plain target_id column in place
// (keeping its index flag) so a table never carries two target_id columns.
void ModelCompiler::AddReferenceColumn(TableDefinition& table, const model::Schema& schema) const {
  const auto* target = schema.Find(kTargetIdField);
  if (!target) {
    throw util::InvalidSchemaFieldError(kTargetIdField, "reference schema " + schema.name + " has no target_id field");
  }
  if (target->reference_type.empty()) {
    throw util::InvalidSchemaFieldError(kTargetIdField,
                                        "reference schema " + schema.name + " does not name a reference_type");
  }

  ColumnSpec column;
  column.name        = kTargetIdField;
  column.type        = ColumnType::kInteger;
  column.foreign_key = table.dataset + "_" + target->reference_type + ".id";

  for (auto& existing : table.columns) {
    if (existing.name == kTargetIdField) {
      column.indexed = existing.indexed;
      existing       = std::move(column);
      return;
    }
  }
  table.columns.push_back(std::move(column));
}

} // namespace annoschema::compiler
