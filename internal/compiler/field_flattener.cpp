#include "field_flattener.hpp"

#include <utility>

#include "internal/compiler/type_map.hpp"
#include "internal/naming/table_name.hpp"
#include "internal/util/errors.hpp"

namespace annoschema::compiler {

using model::ColumnSpec;
using model::ColumnType;
using model::FieldDescriptor;
using model::FieldKind;

namespace {

constexpr const char* kRootIdField = "root_id";

std::string KindName(FieldKind kind) {
  return std::string(model::FieldKindName(kind));
}

} // namespace

FieldFlattener::FieldFlattener(CompilerOptions options) : options_(std::move(options)) {
}

std::vector<ColumnSpec> FieldFlattener::Flatten(const std::string& field_name, const FieldDescriptor& descriptor,
                                                std::string_view dataset, model::Version version) const {
  if (descriptor.drop_column) return {};

  if (auto type = ScalarColumnType(descriptor.kind)) {
    ColumnSpec column;
    column.name    = field_name;
    column.type    = *type;
    column.indexed = descriptor.indexed;
    return {std::move(column)};
  }

  if (descriptor.kind != FieldKind::kNested) {
    throw util::UnsupportedFieldTypeError(field_name, KindName(descriptor.kind));
  }

  if (descriptor.many) {
    throw util::InvalidSchemaFieldError(field_name, "Nested(many=True) not supported");
  }

  std::vector<ColumnSpec> columns;
  columns.reserve(descriptor.fields.size());
  for (const auto& sub : descriptor.fields) {
    columns.push_back(FlattenSubField(field_name + "_" + sub.name, sub.name, sub.descriptor, dataset, version));
  }
  return columns;
}

ColumnSpec FieldFlattener::FlattenSubField(const std::string& column_name, const std::string& sub_name,
                                           const FieldDescriptor& sub, std::string_view dataset,
                                           model::Version version) const {
  ColumnSpec column;
  column.name = column_name;

  // geometry wins over whatever scalar kind the sub-field declares
  if (sub.postgis_geometry) {
    column.type               = ColumnType::kGeometry;
    column.geometry_tag       = *sub.postgis_geometry;
    column.geometry_dimension = options_.geometry_dimension;
    column.indexed            = true;
    return column;
  }

  if (sub.kind == FieldKind::kNested) {
    throw util::InvalidSchemaFieldError(column_name, "nested records may only be one level deep");
  }

  auto type = ScalarColumnType(sub.kind);
  if (!type) {
    throw util::UnsupportedFieldTypeError(column_name, KindName(sub.kind));
  }

  column.type    = *type;
  column.indexed = sub.indexed;

  if (sub_name == kRootIdField) {
    column.foreign_key = naming::EncodeTableName(dataset, options_.root_table_name, version) + ".id";
  }
  return column;
}

} // namespace annoschema::compiler
