#include <iostream>
#include <memory>

#include "internal/assembler/dataset_assembler.hpp"
#include "internal/ddl/ddl_writer.hpp"
#include "internal/registry/builtin_schemas.hpp"

int main(int argc, char** argv) {
  // Dataset can be passed on the command line; defaults to "pinky".
  const std::string dataset = argc > 1 ? argv[1] : "pinky";

  auto registry = std::make_shared<annoschema::registry::MemorySchemaRegistry>();
  annoschema::registry::RegisterBuiltinSchemas(*registry);

  auto cache = std::make_shared<annoschema::cache::ModelCache>();
  annoschema::assembler::DatasetAssembler assembler(registry, cache, annoschema::compiler::ModelCompiler());

  auto models = assembler.AssembleDataset(dataset,
                                          {{"synapse", "synapse"}, {"presynaptic_bouton_type", "bouton_types"}},
                                          1, true);

  for (const auto& [name, table] : models) {
    std::cout << annoschema::ddl::RenderCreateTable(*table, annoschema::ddl::Dialect::kPostgres) << "\n";
    for (const auto& index : annoschema::ddl::RenderCreateIndexes(*table, annoschema::ddl::Dialect::kPostgres)) {
      std::cout << index << "\n";
    }
  }

  // a second request is served from the cache
  auto again = assembler.AssembleDataset(dataset, {{"synapse", "synapse"}}, 1);
  std::cout << "cached models: " << cache->Size() << ", same synapse instance: "
            << (again.at("synapse") == models.at("synapse") ? "yes" : "no") << '\n';
  return 0;
}
