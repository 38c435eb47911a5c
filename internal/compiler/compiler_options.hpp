#pragma once

#include <cstdint>
#include <string>

namespace annoschema::compiler {

struct CompilerOptions {
  // logical name of the per-dataset root entity table; the root model is
  // named Capitalize(dataset) + Capitalize(root_table_name), except for the
  // default which keeps the CellSegment spelling
  std::string   root_table_name    = "cellsegment";
  std::uint32_t geometry_dimension = 3;
};

} // namespace annoschema::compiler
