#include "yaml_schema_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <utility>

namespace annoschema::registry {

using model::FieldDescriptor;
using model::FieldKind;
using model::NamedField;
using model::Schema;

static std::vector<NamedField> ParseFields(const YAML::Node& node, const std::string& context);

static bool ReadBool(const YAML::Node& field, const char* key, const std::string& context) {
  const auto value = field[key];
  if (!value) return false;
  try {
    return value.as<bool>();
  } catch (const YAML::Exception&) {
    throw std::runtime_error(context + ": '" + key + "' must be a boolean");
  }
}

static FieldDescriptor ParseField(const YAML::Node& node, const std::string& context) {
  const auto kind_node = node["kind"];
  if (!kind_node || !kind_node.IsScalar()) {
    throw std::runtime_error(context + ": missing 'kind'");
  }

  auto kind = model::ParseFieldKind(kind_node.Scalar());
  if (!kind) {
    throw std::runtime_error(context + ": unknown kind '" + kind_node.Scalar() + "'");
  }

  FieldDescriptor descriptor;
  descriptor.kind        = *kind;
  descriptor.indexed     = ReadBool(node, "index", context);
  descriptor.drop_column = ReadBool(node, "drop_column", context);
  descriptor.many        = ReadBool(node, "many", context);

  if (const auto geometry = node["postgis_geometry"]) {
    descriptor.postgis_geometry = geometry.Scalar();
  }
  if (const auto reference = node["reference_type"]) {
    descriptor.reference_type = reference.Scalar();
  }
  if (const auto fields = node["fields"]) {
    descriptor.fields = ParseFields(fields, context);
  }

  return descriptor;
}

static std::vector<NamedField> ParseFields(const YAML::Node& node, const std::string& context) {
  if (!node.IsSequence()) {
    throw std::runtime_error(context + ": 'fields' must be a list");
  }

  std::vector<NamedField> fields;
  fields.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    const auto& item = node[i];
    const auto  name = item["name"];
    if (!name || !name.IsScalar() || name.Scalar().empty()) {
      throw std::runtime_error(context + ": field #" + std::to_string(i) + " has no name");
    }
    fields.push_back({name.Scalar(), ParseField(item, context + "." + name.Scalar())});
  }
  return fields;
}

static std::vector<Schema> ParseDocument(const YAML::Node& root) {
  const auto schemas = root["schemas"];
  if (!schemas || !schemas.IsMap()) {
    throw std::runtime_error("schema document must contain a 'schemas' map");
  }

  std::vector<Schema> out;
  for (auto it : schemas) {
    Schema schema;
    schema.name = it.first.Scalar();

    const auto& body = it.second;
    schema.fields    = ParseFields(body["fields"], schema.name);

    // reference schemas name their target entity once, on the schema
    if (const auto reference = body["reference_type"]) {
      schema.category = model::SchemaCategory::kReference;

      bool has_target = false;
      for (auto& field : schema.fields) {
        if (field.name != "target_id") continue;
        has_target = true;
        if (field.descriptor.reference_type.empty()) {
          field.descriptor.reference_type = reference.Scalar();
        }
      }
      if (!has_target) {
        schema.fields.insert(schema.fields.begin(), NamedField{"target_id", model::Reference(reference.Scalar())});
      }
    }

    out.push_back(std::move(schema));
  }
  return out;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

std::vector<Schema> YamlSchemaLoader::LoadFromFile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load schema file " + path + ": " + std::string(e.what()));
  }
  return ParseDocument(yaml);
}

std::vector<Schema> YamlSchemaLoader::LoadFromString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse schema YAML: " + std::string(e.what()));
  }
  return ParseDocument(node);
}

} // namespace annoschema::registry
