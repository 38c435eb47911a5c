#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace annoschema::model {

/*
  Closed set of field kinds a schema description may use.

  Only some of them map to columns; the compiler rejects the rest.
*/
enum class FieldKind {
  kNumeric,
  kInteger,
  kFloat,
  kString,
  kBoolean,
  kNested,
  kReference,
  kList,
  kDateTime,
};

std::string_view FieldKindName(FieldKind kind);
std::optional<FieldKind> ParseFieldKind(std::string_view name);

struct NamedField;

struct FieldDescriptor {
  FieldKind kind = FieldKind::kString;

  bool indexed     = false;
  bool drop_column = false;

  // nested fields only: one value expands to many rows
  bool many = false;

  // geometry tag such as POINTZ; overrides the scalar kind of a sub-field
  std::optional<std::string> postgis_geometry;

  // entity type a reference field points at
  std::string reference_type;

  // nested fields only, in declaration order
  std::vector<NamedField> fields;
};

struct NamedField {
  std::string     name;
  FieldDescriptor descriptor;
};

enum class SchemaCategory {
  kAnnotation,
  kReference,
};

/*
  Schema

  Named, ordered field mapping supplied by a registry. Immutable once
  registered; shared as std::shared_ptr<const Schema>.
*/
struct Schema {
  std::string             name;
  SchemaCategory          category = SchemaCategory::kAnnotation;
  std::vector<NamedField> fields;

  bool IsReference() const {
    return category == SchemaCategory::kReference;
  }

  const FieldDescriptor* Find(std::string_view field_name) const;
};

// descriptor builders
FieldDescriptor Scalar(FieldKind kind, bool indexed = false);
FieldDescriptor Nested(std::vector<NamedField> fields, bool indexed = false);
FieldDescriptor Geometry(std::string tag, FieldKind kind = FieldKind::kList);
FieldDescriptor Reference(std::string reference_type, bool indexed = false);

} // namespace annoschema::model
