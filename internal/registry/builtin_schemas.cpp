#include "builtin_schemas.hpp"

#include <utility>

namespace annoschema::registry {

using model::FieldDescriptor;
using model::FieldKind;
using model::NamedField;
using model::Schema;
using model::SchemaCategory;

namespace {

constexpr const char* kPointGeometry = "POINTZ";

// fields every annotation carries; "type" is implied by the table
std::vector<NamedField> AnnotationFields() {
  auto type        = model::Scalar(FieldKind::kString);
  type.drop_column = true;
  return {{"type", std::move(type)}};
}

Schema MakeSchema(std::string name, std::vector<NamedField> fields,
                  SchemaCategory category = SchemaCategory::kAnnotation) {
  Schema schema;
  schema.name     = std::move(name);
  schema.category = category;
  schema.fields   = AnnotationFields();
  for (auto& field : fields) {
    schema.fields.push_back(std::move(field));
  }
  return schema;
}

Schema MakeReferenceSchema(std::string name, std::string reference_type, std::vector<NamedField> fields) {
  fields.insert(fields.begin(), NamedField{"target_id", model::Reference(std::move(reference_type))});
  return MakeSchema(std::move(name), std::move(fields), SchemaCategory::kReference);
}

} // namespace

FieldDescriptor SpatialPoint(bool indexed) {
  return model::Nested({{"position", model::Geometry(kPointGeometry)}}, indexed);
}

FieldDescriptor BoundSpatialPoint(bool indexed) {
  return model::Nested({{"position", model::Geometry(kPointGeometry)},
                        {"supervoxel_id", model::Scalar(FieldKind::kNumeric)},
                        {"root_id", model::Scalar(FieldKind::kNumeric, true)}},
                       indexed);
}

Schema SynapseSchema() {
  return MakeSchema("synapse", {{"pre_pt", BoundSpatialPoint(true)},
                                {"ctr_pt", SpatialPoint()},
                                {"post_pt", BoundSpatialPoint(true)},
                                {"size", model::Scalar(FieldKind::kFloat)}});
}

Schema BoundTagSchema() {
  return MakeSchema("bound_tag", {{"pt", BoundSpatialPoint(true)}, {"tag", model::Scalar(FieldKind::kString)}});
}

Schema CellTypeLocalSchema() {
  return MakeSchema("cell_type_local", {{"cell_type", model::Scalar(FieldKind::kString)},
                                        {"classification_system", model::Scalar(FieldKind::kString)},
                                        {"pt", BoundSpatialPoint(true)}});
}

Schema PresynapticBoutonTypeSchema() {
  return MakeReferenceSchema("presynaptic_bouton_type", "synapse",
                             {{"bouton_type", model::Scalar(FieldKind::kString)}});
}

Schema PostsynapticCompartmentSchema() {
  return MakeReferenceSchema("postsynaptic_compartment", "synapse",
                             {{"compartment", model::Scalar(FieldKind::kString)}});
}

Schema ContactSchema() {
  return MakeSchema("contact", {{"sidea_pt", BoundSpatialPoint(true)},
                                {"sideb_pt", BoundSpatialPoint(true)},
                                {"ctr_pt", SpatialPoint()},
                                {"size", model::Scalar(FieldKind::kInteger)}});
}

void RegisterBuiltinSchemas(MemorySchemaRegistry& registry) {
  registry.Register(SynapseSchema());
  registry.Register(BoundTagSchema());
  registry.Register(CellTypeLocalSchema());
  registry.Register(PresynapticBoutonTypeSchema());
  registry.Register(PostsynapticCompartmentSchema());
}

} // namespace annoschema::registry
