#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "compiler_options.hpp"
#include "internal/model/field.hpp"
#include "internal/model/table.hpp"

namespace annoschema::compiler {

/*
  Turns one schema field into a fixed-width set of columns.

  Nested records are flattened one level deep into "<field>_<sub>"
  columns; a "root_id" sub-field becomes a foreign key to the dataset's
  root entity table. Stateless apart from its options.
*/
class FieldFlattener {
 public:
  explicit FieldFlattener(CompilerOptions options);

  std::vector<model::ColumnSpec> Flatten(const std::string& field_name, const model::FieldDescriptor& descriptor,
                                         std::string_view dataset, model::Version version) const;

 private:
  model::ColumnSpec FlattenSubField(const std::string& column_name, const std::string& sub_name,
                                    const model::FieldDescriptor& sub, std::string_view dataset,
                                    model::Version version) const;

  CompilerOptions options_;
};

} // namespace annoschema::compiler
