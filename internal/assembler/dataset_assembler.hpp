#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/model_cache.hpp"
#include "internal/compiler/model_compiler.hpp"
#include "internal/registry/schema_registry.hpp"

namespace annoschema::assembler {

struct SchemaTable {
  std::string schema_name;
  std::string table_name;
};

// table name -> compiled model; the root table is stored under its logical name
using DatasetModels = std::map<std::string, cache::ModelPtr>;

/*
  DatasetAssembler

  Builds every table of a dataset: the root entity table, each
  requested annotation table and optionally the contact table. Names are
  validated against the registry before anything is compiled, so an
  unknown schema never touches the cache.

  A failure compiling one table aborts the whole assembly; tables that
  compiled before it stay cached.
*/
class DatasetAssembler {
 public:
  static constexpr const char* kContactTable = "contact";

  DatasetAssembler(std::shared_ptr<const registry::SchemaRegistry> registry, std::shared_ptr<cache::ModelCache> cache,
                   compiler::ModelCompiler compiler);

  DatasetModels AssembleDataset(const std::string& dataset, const std::vector<SchemaTable>& tables,
                                model::Version version, bool include_contacts = false) const;

  // Datasets are assembled in parallel after a single name check.
  std::map<std::string, DatasetModels> AssembleAll(const std::vector<std::string>& datasets,
                                                   const std::vector<SchemaTable>& tables, model::Version version,
                                                   bool include_contacts = false) const;

  // Throws util::UnknownSchemaError listing every unregistered name.
  void ValidateSchemaNames(const std::vector<SchemaTable>& tables) const;

  cache::ModelPtr MakeRootModel(const std::string& dataset, model::Version version) const;

  cache::ModelPtr MakeAnnotationModel(const std::string& dataset, const std::string& schema_name,
                                      const std::string& table_name, model::Version version) const;

  cache::ModelPtr MakeModelFromSchema(const std::string& dataset, const std::string& table_name,
                                      const model::Schema& schema, model::Version version) const;

 private:
  DatasetModels Assemble(const std::string& dataset, const std::vector<SchemaTable>& tables, model::Version version,
                         bool include_contacts) const;

  std::shared_ptr<const registry::SchemaRegistry> registry_;
  std::shared_ptr<cache::ModelCache>              cache_;
  compiler::ModelCompiler                         compiler_;
  model::Schema                                   contact_schema_;
};

} // namespace annoschema::assembler
