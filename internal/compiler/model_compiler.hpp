#pragma once

#include <string>

#include "compiler_options.hpp"
#include "field_flattener.hpp"
#include "internal/model/field.hpp"
#include "internal/model/table.hpp"

namespace annoschema::compiler {

/*
  ModelCompiler

  Compiles a schema into a TableDefinition for one (dataset, table,
  version). Pure: no caching, no shared state, safe to call from any
  number of threads. Errors from the flattener propagate unchanged.
*/
class ModelCompiler {
 public:
  explicit ModelCompiler(CompilerOptions options = {});

  model::TableDefinition Compile(const std::string& dataset, const std::string& table_name,
                                 const model::Schema& schema, model::Version version) const;

  // Root entity table: only the externally assigned "id".
  model::TableDefinition CompileRoot(const std::string& dataset, model::Version version) const;

  const CompilerOptions& options() const {
    return options_;
  }

 private:
  void AddReferenceColumn(model::TableDefinition& table, const model::Schema& schema) const;

  CompilerOptions options_;
  FieldFlattener  flattener_;
};

} // namespace annoschema::compiler
