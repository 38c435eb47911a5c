#include "internal/model/field.hpp"

#include <utility>

namespace annoschema::model {

std::string_view FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kNumeric: return "numeric";
    case FieldKind::kInteger: return "integer";
    case FieldKind::kFloat: return "float";
    case FieldKind::kString: return "string";
    case FieldKind::kBoolean: return "boolean";
    case FieldKind::kNested: return "nested";
    case FieldKind::kReference: return "reference";
    case FieldKind::kList: return "list";
    case FieldKind::kDateTime: return "datetime";
  }
  return "unknown";
}

std::optional<FieldKind> ParseFieldKind(std::string_view name) {
  static constexpr FieldKind kAll[] = {FieldKind::kNumeric, FieldKind::kInteger, FieldKind::kFloat,
                                       FieldKind::kString,  FieldKind::kBoolean, FieldKind::kNested,
                                       FieldKind::kReference, FieldKind::kList, FieldKind::kDateTime};
  for (auto kind : kAll) {
    if (FieldKindName(kind) == name) return kind;
  }

  // short aliases used by schema files
  if (name == "int") return FieldKind::kInteger;
  if (name == "str") return FieldKind::kString;
  if (name == "bool") return FieldKind::kBoolean;

  return std::nullopt;
}

const FieldDescriptor* Schema::Find(std::string_view field_name) const {
  for (const auto& field : fields) {
    if (field.name == field_name) return &field.descriptor;
  }
  return nullptr;
}

FieldDescriptor Scalar(FieldKind kind, bool indexed) {
  FieldDescriptor d;
  d.kind    = kind;
  d.indexed = indexed;
  return d;
}

FieldDescriptor Nested(std::vector<NamedField> fields, bool indexed) {
  FieldDescriptor d;
  d.kind    = FieldKind::kNested;
  d.indexed = indexed;
  d.fields  = std::move(fields);
  return d;
}

FieldDescriptor Geometry(std::string tag, FieldKind kind) {
  FieldDescriptor d;
  d.kind             = kind;
  d.postgis_geometry = std::move(tag);
  return d;
}

FieldDescriptor Reference(std::string reference_type, bool indexed) {
  FieldDescriptor d;
  d.kind           = FieldKind::kReference;
  d.indexed        = indexed;
  d.reference_type = std::move(reference_type);
  return d;
}

} // namespace annoschema::model
