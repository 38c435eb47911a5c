#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/ddl/ddl_writer.hpp"
#include "internal/factory.hpp"
#include "internal/naming/table_name.hpp"
#include "internal/observability/logging.hpp"

using annoschema::assembler::DatasetModels;
using annoschema::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  annoschemactl [--config] <config.yaml> schemas\n"
            << "  annoschemactl [--config] <config.yaml> compile\n"
            << "  annoschemactl [--config] <config.yaml> ddl\n"
            << "  annoschemactl [--config] <config.yaml> next-version <dataset>\n";
}

static std::map<std::string, DatasetModels> AssembleConfigured(const annoschema::runtime::config::RuntimeConfig& config,
                                                               const annoschema::factory::Application& app) {
  const auto& build  = config.build();
  const auto  tables = annoschema::factory::SchemaTablesFromConfig(config);
  const std::vector<std::string> datasets(build.datasets().begin(), build.datasets().end());

  if (!build.version_from_catalog()) {
    return app.assembler->AssembleAll(datasets, tables, build.version(), build.include_contacts());
  }

  auto source = annoschema::factory::BuildTableSource(config);
  if (!source) {
    throw std::runtime_error("build.version_from_catalog requires catalog.sqlite_path");
  }
  const auto existing = source->ListTableNames();

  std::map<std::string, DatasetModels> out;
  for (const auto& dataset : datasets) {
    const auto version = annoschema::naming::NextVersion(existing, dataset);
    ANNOSCHEMA_LOG_INFO("Discovered version", {StringField("dataset", dataset),
                                               annoschema::observability::IntField("version", version)});
    out[dataset] = app.assembler->AssembleDataset(dataset, tables, version, build.include_contacts());
  }
  return out;
}

static void PrintLayout(const std::map<std::string, DatasetModels>& assembled) {
  for (const auto& [dataset, models] : assembled) {
    for (const auto& [key, table] : models) {
      std::cout << dataset << "/" << key << " -> " << table->table_name << " (" << table->model_name << ")\n";
      for (const auto& column : table->columns) {
        std::cout << "  " << column.name << " " << annoschema::model::ColumnTypeName(column.type);
        if (column.primary_key) std::cout << " primary_key";
        if (column.indexed) std::cout << " indexed";
        if (column.foreign_key) std::cout << " -> " << *column.foreign_key;
        if (!column.geometry_tag.empty()) {
          std::cout << " " << column.geometry_tag << "/" << column.geometry_dimension << "d";
        }
        std::cout << "\n";
      }
    }
  }
}

static void PrintDdl(const std::map<std::string, DatasetModels>& assembled, annoschema::ddl::Dialect dialect) {
  for (const auto& [dataset, models] : assembled) {
    std::cout << "-- dataset " << dataset << "\n";

    // root entity table first so foreign keys resolve in order
    std::vector<annoschema::cache::ModelPtr> ordered;
    for (const auto& [key, table] : models) {
      if (table->ForeignKeys().empty()) ordered.insert(ordered.begin(), table);
      else ordered.push_back(table);
    }

    for (const auto& table : ordered) {
      std::cout << annoschema::ddl::RenderCreateTable(*table, dialect) << "\n";
      for (const auto& index : annoschema::ddl::RenderCreateIndexes(*table, dialect)) {
        std::cout << index << "\n";
      }
      std::cout << "\n";
    }
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (!args.empty() && args.front() == "--config") {
    args.erase(args.begin());
  }
  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string config_path = args[0];
  const std::string cmd         = args[1];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = annoschema::config::ConfigLoader::LoadFromYaml(config_path);
    annoschema::observability::InitializeLogging(config);

    auto dialect = annoschema::ddl::ParseDialect(config.output().dialect());
    if (!dialect) {
      std::cerr << "unsupported dialect: " << config.output().dialect() << "\n";
      return 1;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = annoschema::factory::Build(config);

    if (cmd == "schemas") {
      for (const auto& name : app.registry->ValidNames()) {
        std::cout << name << "\n";
      }
    } else if (cmd == "compile") {
      PrintLayout(AssembleConfigured(config, app));
    } else if (cmd == "ddl") {
      PrintDdl(AssembleConfigured(config, app), *dialect);
    } else if (cmd == "next-version") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      auto source = annoschema::factory::BuildTableSource(config);
      if (!source) {
        std::cerr << "next-version requires catalog.sqlite_path in the config\n";
        return 1;
      }
      std::cout << annoschema::naming::NextVersion(source->ListTableNames(), args[2]) << "\n";
    } else {
      Usage();
      return 1;
    }

    annoschema::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ANNOSCHEMA_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    annoschema::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
