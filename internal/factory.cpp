#include "factory.hpp"

#include <string>
#include <utility>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_table_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/builtin_schemas.hpp"
#include "internal/registry/yaml_schema_loader.hpp"

namespace annoschema::factory {

using annoschema::runtime::config::RuntimeConfig;

compiler::CompilerOptions CompilerOptionsFromConfig(const RuntimeConfig& config) {
  compiler::CompilerOptions options;
  if (!config.compiler().root_table_name().empty()) {
    options.root_table_name = config.compiler().root_table_name();
  }
  if (config.compiler().geometry_dimension() != 0) {
    options.geometry_dimension = config.compiler().geometry_dimension();
  }
  return options;
}

std::vector<assembler::SchemaTable> SchemaTablesFromConfig(const RuntimeConfig& config) {
  std::vector<assembler::SchemaTable> tables;
  for (const auto& entry : config.build().tables()) {
    // table name defaults to the schema name
    tables.push_back({entry.schema(), entry.table().empty() ? entry.schema() : entry.table()});
  }
  return tables;
}

Application Build(const RuntimeConfig& config) {
  Application app;

  app.registry = std::make_shared<registry::MemorySchemaRegistry>();
  if (!config.registry().skip_builtin_schemas()) {
    registry::RegisterBuiltinSchemas(*app.registry);
  }

  for (const auto& path : config.registry().schema_files()) {
    auto schemas = registry::YamlSchemaLoader::LoadFromFile(path);
    ANNOSCHEMA_LOG_INFO("Loaded schema file", {observability::StringField("path", path),
                                               observability::IntField("schemas", static_cast<std::int64_t>(schemas.size()))});
    for (auto& schema : schemas) {
      app.registry->Register(std::move(schema));
    }
  }

  app.cache     = std::make_shared<cache::ModelCache>();
  app.assembler = std::make_shared<assembler::DatasetAssembler>(
      app.registry, app.cache, compiler::ModelCompiler(CompilerOptionsFromConfig(config)));

  return app;
}

std::unique_ptr<db::TableNameSource> BuildTableSource(const RuntimeConfig& config) {
  const auto& path = config.catalog().sqlite_path();
  if (path.empty()) return nullptr;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::SqliteDB::Mode::kReadOnly);
  return std::make_unique<db::sqlite::SqliteTableSource>(std::move(sqlite_db));
}

} // namespace annoschema::factory
