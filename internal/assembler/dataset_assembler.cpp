#include "dataset_assembler.hpp"

#include <future>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/registry/builtin_schemas.hpp"
#include "internal/util/errors.hpp"

namespace annoschema::assembler {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

DatasetAssembler::DatasetAssembler(std::shared_ptr<const registry::SchemaRegistry> registry,
                                   std::shared_ptr<cache::ModelCache> cache, compiler::ModelCompiler compiler)
    : registry_(std::move(registry)),
      cache_(std::move(cache)),
      compiler_(std::move(compiler)),
      contact_schema_(registry::ContactSchema()) {
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void DatasetAssembler::ValidateSchemaNames(const std::vector<SchemaTable>& tables) const {
  const auto valid = registry_->ValidNames();

  std::vector<std::string> unknown;
  for (const auto& entry : tables) {
    if (valid.count(entry.schema_name) == 0) {
      unknown.push_back(entry.schema_name);
    }
  }

  if (!unknown.empty()) {
    util::UnknownSchemaError error(std::move(unknown));
    ANNOSCHEMA_LOG_WARN("Rejected unknown schema names", {StringField("error", error.what())});
    throw error;
  }
}

// ------------------------------------------------------------
// Single models
// ------------------------------------------------------------

cache::ModelPtr DatasetAssembler::MakeRootModel(const std::string& dataset, model::Version version) const {
  return cache_->GetOrCompile(dataset, compiler_.options().root_table_name, version,
                              [&] { return compiler_.CompileRoot(dataset, version); });
}

cache::ModelPtr DatasetAssembler::MakeModelFromSchema(const std::string& dataset, const std::string& table_name,
                                                      const model::Schema& schema, model::Version version) const {
  return cache_->GetOrCompile(dataset, table_name, version,
                              [&] { return compiler_.Compile(dataset, table_name, schema, version); });
}

cache::ModelPtr DatasetAssembler::MakeAnnotationModel(const std::string& dataset, const std::string& schema_name,
                                                      const std::string& table_name, model::Version version) const {
  std::shared_ptr<const model::Schema> schema;
  try {
    schema = registry_->Lookup(schema_name);
  } catch (const util::NotFound&) {
    throw util::UnknownSchemaError({schema_name});
  }
  return MakeModelFromSchema(dataset, table_name, *schema, version);
}

// ------------------------------------------------------------
// Datasets
// ------------------------------------------------------------

DatasetModels DatasetAssembler::AssembleDataset(const std::string& dataset, const std::vector<SchemaTable>& tables,
                                                model::Version version, bool include_contacts) const {
  ValidateSchemaNames(tables);
  return Assemble(dataset, tables, version, include_contacts);
}

std::map<std::string, DatasetModels> DatasetAssembler::AssembleAll(const std::vector<std::string>& datasets,
                                                                   const std::vector<SchemaTable>& tables,
                                                                   model::Version version,
                                                                   bool include_contacts) const {
  ValidateSchemaNames(tables);

  std::vector<std::future<DatasetModels>> pending;
  pending.reserve(datasets.size());
  for (const auto& dataset : datasets) {
    pending.push_back(std::async(std::launch::async, [this, &dataset, &tables, version, include_contacts] {
      return Assemble(dataset, tables, version, include_contacts);
    }));
  }

  // get() rethrows the first failure; the remaining futures still join
  std::map<std::string, DatasetModels> out;
  for (std::size_t i = 0; i < datasets.size(); ++i) {
    out[datasets[i]] = pending[i].get();
  }
  return out;
}

DatasetModels DatasetAssembler::Assemble(const std::string& dataset, const std::vector<SchemaTable>& tables,
                                         model::Version version, bool include_contacts) const {
  ANNOSCHEMA_LOG_INFO("Assembling dataset", {StringField("dataset", dataset), IntField("version", version),
                                             IntField("tables", static_cast<std::int64_t>(tables.size())),
                                             BoolField("include_contacts", include_contacts)});

  DatasetModels models;
  models[compiler_.options().root_table_name] = MakeRootModel(dataset, version);

  for (const auto& entry : tables) {
    models[entry.table_name] = MakeAnnotationModel(dataset, entry.schema_name, entry.table_name, version);
  }

  if (include_contacts) {
    models[kContactTable] = MakeModelFromSchema(dataset, kContactTable, contact_schema_, version);
  }

  ANNOSCHEMA_LOG_INFO("Assembled dataset",
                      {StringField("dataset", dataset), IntField("models", static_cast<std::int64_t>(models.size()))});
  return models;
}

} // namespace annoschema::assembler
