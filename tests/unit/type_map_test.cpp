#include "internal/compiler/type_map.hpp"

#include <cassert>
#include <iostream>

namespace {

using annoschema::compiler::ScalarColumnType;
using annoschema::model::ColumnType;
using annoschema::model::FieldKind;

void TestScalarKindsMap() {
  assert(ScalarColumnType(FieldKind::kNumeric) == ColumnType::kNumeric);
  assert(ScalarColumnType(FieldKind::kInteger) == ColumnType::kInteger);
  assert(ScalarColumnType(FieldKind::kFloat) == ColumnType::kFloat);
  assert(ScalarColumnType(FieldKind::kString) == ColumnType::kString);
  assert(ScalarColumnType(FieldKind::kBoolean) == ColumnType::kBoolean);
}

void TestReferenceIdsAreIntegers() {
  assert(ScalarColumnType(FieldKind::kReference) == ColumnType::kInteger);
}

void TestCompositeAndUnmappedKindsHaveNoScalarType() {
  assert(!ScalarColumnType(FieldKind::kNested).has_value());
  assert(!ScalarColumnType(FieldKind::kList).has_value());
  assert(!ScalarColumnType(FieldKind::kDateTime).has_value());
}

} // namespace

int main() {
  TestScalarKindsMap();
  TestReferenceIdsAreIntegers();
  TestCompositeAndUnmappedKindsHaveNoScalarType();

  std::cout << "annoschema_unit_type_map: pass\n";
  return 0;
}
