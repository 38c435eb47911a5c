#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/assembler/dataset_assembler.hpp"
#include "internal/cache/model_cache.hpp"
#include "internal/compiler/model_compiler.hpp"
#include "internal/db/table_source.hpp"
#include "internal/registry/memory_registry.hpp"

namespace annoschema::factory {

/*
  Application

  Owns the long-lived objects of one compiler process. The cache is
  shared by everything built from it.
*/
struct Application {
  std::shared_ptr<registry::MemorySchemaRegistry> registry;
  std::shared_ptr<cache::ModelCache>              cache;
  std::shared_ptr<assembler::DatasetAssembler>    assembler;
};

compiler::CompilerOptions CompilerOptionsFromConfig(const annoschema::runtime::config::RuntimeConfig& config);

std::vector<assembler::SchemaTable> SchemaTablesFromConfig(const annoschema::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: registers built-in and file-declared schemas and
  wires registry, cache and compiler into an assembler.
*/
Application Build(const annoschema::runtime::config::RuntimeConfig& config);

// nullptr when no catalog is configured
std::unique_ptr<db::TableNameSource> BuildTableSource(const annoschema::runtime::config::RuntimeConfig& config);

} // namespace annoschema::factory
