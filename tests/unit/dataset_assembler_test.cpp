#include "internal/assembler/dataset_assembler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/registry/builtin_schemas.hpp"
#include "internal/util/errors.hpp"

namespace {

using annoschema::assembler::DatasetAssembler;
using annoschema::assembler::SchemaTable;
using annoschema::cache::ModelCache;
using annoschema::compiler::ModelCompiler;
using annoschema::model::FieldKind;
using annoschema::registry::MemorySchemaRegistry;

struct Fixture {
  std::shared_ptr<MemorySchemaRegistry> registry = std::make_shared<MemorySchemaRegistry>();
  std::shared_ptr<ModelCache>           cache    = std::make_shared<ModelCache>();
  std::unique_ptr<DatasetAssembler>     assembler;

  Fixture() {
    annoschema::registry::RegisterBuiltinSchemas(*registry);
    assembler = std::make_unique<DatasetAssembler>(registry, cache, ModelCompiler());
  }
};

void TestSynapseDatasetExample() {
  Fixture f;

  auto models = f.assembler->AssembleDataset("pinky", {{"synapse", "synapse_table"}}, 1, false);
  assert(models.size() == 2);

  const auto& root = models.at("cellsegment");
  assert(root->table_name == "pinky_cellsegment_v1");

  const auto& synapse = models.at("synapse_table");
  assert(synapse->table_name == "pinky_synapse_table_v1");
  assert(synapse->PrimaryKey().name == "id");

  const auto* position = synapse->FindColumn("pre_pt_position");
  assert(position != nullptr && position->indexed);
  assert(f.cache->Size() == 2);
}

void TestUnknownSchemasRejectedBeforeCompiling() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.assembler->AssembleDataset("pinky",
                                       {{"synapse", "synapse"}, {"no_such", "a"}, {"bound_tag", "tags"}, {"nope", "b"}},
                                       1, true);
  } catch (const annoschema::util::UnknownSchemaError& e) {
    threw = true;
    assert(e.names().size() == 2);
    assert(e.names()[0] == "no_such");
    assert(e.names()[1] == "nope");
  }
  assert(threw);

  // not even the root table was compiled
  assert(f.cache->Size() == 0);
}

void TestContactsAreOptional() {
  Fixture f;

  auto without = f.assembler->AssembleDataset("pinky", {}, 0, false);
  assert(without.size() == 1);
  assert(without.count("contact") == 0);

  auto with = f.assembler->AssembleDataset("pinky", {}, 0, true);
  assert(with.size() == 2);

  const auto& contact = with.at("contact");
  assert(contact->table_name == "pinky_contact_v0");
  assert(contact->FindColumn("sidea_pt_root_id")->foreign_key == std::string("pinky_cellsegment_v0.id"));
  assert(contact->FindColumn("sideb_pt_root_id")->foreign_key == std::string("pinky_cellsegment_v0.id"));
}

void TestRepeatedAssemblyReturnsSameInstances() {
  Fixture f;

  auto first  = f.assembler->AssembleDataset("pinky", {{"synapse", "synapse"}}, 1, true);
  auto second = f.assembler->AssembleDataset("pinky", {{"synapse", "synapse"}}, 1, true);

  assert(first.at("synapse") == second.at("synapse"));
  assert(first.at("cellsegment") == second.at("cellsegment"));
  assert(first.at("contact") == second.at("contact"));
  assert(f.cache->Size() == 3);
}

void TestFailingTableAbortsAssemblyWithoutCachingIt() {
  Fixture f;

  annoschema::model::Schema deep;
  deep.name   = "deep";
  deep.fields = {{"outer", annoschema::model::Nested({{"inner", annoschema::registry::SpatialPoint()}})}};
  f.registry->Register(deep);

  bool threw = false;
  try {
    (void)f.assembler->AssembleDataset("pinky", {{"synapse", "synapse"}, {"deep", "deep"}, {"bound_tag", "tags"}}, 1);
  } catch (const annoschema::util::InvalidSchemaFieldError&) {
    threw = true;
  }
  assert(threw);

  assert(f.cache->Contains("pinky", "cellsegment", 1));
  assert(f.cache->Contains("pinky", "synapse", 1));
  assert(!f.cache->Contains("pinky", "deep", 1));
  assert(!f.cache->Contains("pinky", "tags", 1));
}

void TestAssembleAllBuildsIndependentDatasets() {
  Fixture f;

  auto all = f.assembler->AssembleAll({"pinky", "basil", "minnie"},
                                      {{"synapse", "synapse"}, {"presynaptic_bouton_type", "bouton"}}, 2, true);
  assert(all.size() == 3);

  for (const auto& dataset : {"pinky", "basil", "minnie"}) {
    const auto& models = all.at(dataset);
    assert(models.size() == 4);
    assert(models.at("synapse")->table_name == std::string(dataset) + "_synapse_v2");
    assert(models.at("synapse")->polymorphic_identity == dataset);
    assert(models.at("bouton")->FindColumn("target_id")->foreign_key == std::string(dataset) + "_synapse.id");
  }

  assert(all.at("pinky").at("synapse") != all.at("basil").at("synapse"));
  assert(f.cache->Size() == 12);
}

void TestAssembleAllValidatesOnce() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.assembler->AssembleAll({"pinky", "basil"}, {{"missing", "m"}}, 1);
  } catch (const annoschema::util::UnknownSchemaError& e) {
    threw = true;
    assert(e.names().size() == 1);
  }
  assert(threw);
  assert(f.cache->Size() == 0);
}

void TestCustomRootTableName() {
  auto registry = std::make_shared<MemorySchemaRegistry>();
  annoschema::registry::RegisterBuiltinSchemas(*registry);

  annoschema::compiler::CompilerOptions options;
  options.root_table_name = "neuron";
  DatasetAssembler assembler(registry, std::make_shared<ModelCache>(), ModelCompiler(options));

  auto models = assembler.AssembleDataset("pinky", {{"bound_tag", "tags"}}, 1);
  assert(models.count("neuron") == 1);
  assert(models.at("neuron")->table_name == "pinky_neuron_v1");
  assert(models.at("tags")->FindColumn("pt_root_id")->foreign_key == std::string("pinky_neuron_v1.id"));
}

} // namespace

int main() {
  TestSynapseDatasetExample();
  TestUnknownSchemasRejectedBeforeCompiling();
  TestContactsAreOptional();
  TestRepeatedAssemblyReturnsSameInstances();
  TestFailingTableAbortsAssemblyWithoutCachingIt();
  TestAssembleAllBuildsIndependentDatasets();
  TestAssembleAllValidatesOnce();
  TestCustomRootTableName();

  std::cout << "annoschema_unit_dataset_assembler: pass\n";
  return 0;
}
