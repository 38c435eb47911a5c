#include "internal/registry/yaml_schema_loader.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/compiler/model_compiler.hpp"
#include "internal/registry/memory_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using annoschema::model::FieldKind;
using annoschema::registry::YamlSchemaLoader;

constexpr const char* kSchemas = R"(schemas:
  func_coreg:
    fields:
      - name: type
        kind: str
        drop_column: true
      - name: pt
        kind: nested
        index: true
        fields:
          - name: position
            kind: list
            postgis_geometry: POINTZ
          - name: root_id
            kind: numeric
            index: true
      - name: func_id
        kind: int
  spine_label:
    reference_type: synapse
    fields:
      - name: label
        kind: string
)";

void TestFieldsAndOrderArePreserved() {
  auto schemas = YamlSchemaLoader::LoadFromString(kSchemas);
  assert(schemas.size() == 2);

  const auto& coreg = schemas[0].name == "func_coreg" ? schemas[0] : schemas[1];
  assert(!coreg.IsReference());
  assert(coreg.fields.size() == 3);
  assert(coreg.fields[0].name == "type" && coreg.fields[0].descriptor.drop_column);
  assert(coreg.fields[1].name == "pt");

  const auto& pt = coreg.fields[1].descriptor;
  assert(pt.kind == FieldKind::kNested && pt.indexed);
  assert(pt.fields.size() == 2);
  assert(pt.fields[0].descriptor.postgis_geometry == std::string("POINTZ"));
  assert(pt.fields[1].name == "root_id" && pt.fields[1].descriptor.indexed);
  assert(coreg.fields[2].descriptor.kind == FieldKind::kInteger);
}

void TestReferenceTypeMakesReferenceSchema() {
  auto schemas = YamlSchemaLoader::LoadFromString(kSchemas);

  const auto& spine = schemas[0].name == "spine_label" ? schemas[0] : schemas[1];
  assert(spine.IsReference());

  const auto* target = spine.Find("target_id");
  assert(target != nullptr);
  assert(target->kind == FieldKind::kReference);
  assert(target->reference_type == "synapse");
}

void TestLoadedSchemasCompile() {
  annoschema::registry::MemorySchemaRegistry registry;
  for (auto& schema : YamlSchemaLoader::LoadFromString(kSchemas)) {
    registry.Register(std::move(schema));
  }

  annoschema::compiler::ModelCompiler compiler;
  const auto table = compiler.Compile("pinky", "coreg", *registry.Lookup("func_coreg"), 1);
  assert(table.columns.size() == 4);
  assert(table.FindColumn("pt_root_id")->foreign_key == std::string("pinky_cellsegment_v1.id"));

  const auto spine = compiler.Compile("pinky", "spines", *registry.Lookup("spine_label"), 1);
  assert(spine.FindColumn("target_id")->foreign_key == std::string("pinky_synapse.id"));
}

void TestMalformedDocumentsAreRejected() {
  const char* bad_documents[] = {
      "not_schemas: {}\n",
      "schemas:\n  a:\n    fields:\n      - name: x\n",
      "schemas:\n  a:\n    fields:\n      - name: x\n        kind: tensor\n",
      "schemas:\n  a:\n    fields:\n      - kind: int\n",
      "schemas:\n  a:\n    fields: nope\n",
      "schemas:\n  a:\n    fields:\n      - name: x\n        kind: int\n        index: maybe\n",
      "schemas: [unclosed\n",
  };

  for (const auto* document : bad_documents) {
    bool threw = false;
    try {
      (void)YamlSchemaLoader::LoadFromString(document);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestUnknownLookupThrowsNotFound() {
  annoschema::registry::MemorySchemaRegistry registry;

  bool threw = false;
  try {
    (void)registry.Lookup("missing");
  } catch (const annoschema::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(registry.ValidNames().empty());
}

} // namespace

int main() {
  TestFieldsAndOrderArePreserved();
  TestReferenceTypeMakesReferenceSchema();
  TestLoadedSchemasCompile();
  TestMalformedDocumentsAreRejected();
  TestUnknownLookupThrowsNotFound();

  std::cout << "annoschema_unit_yaml_schema_loader: pass\n";
  return 0;
}
