#pragma once

#include <string>
#include <vector>

#include "internal/model/field.hpp"

namespace annoschema::registry {

/*
  Reads schema descriptions from YAML.

    schemas:
      synapse:
        reference_type: ...      # optional; makes it a reference schema
        fields:
          - name: pre_pt
            kind: nested
            index: true
            fields:
              - name: position
                kind: list
                postgis_geometry: POINTZ

  Field order is preserved. Malformed documents throw std::runtime_error.
*/
class YamlSchemaLoader {
 public:
  static std::vector<model::Schema> LoadFromFile(const std::string& path);
  static std::vector<model::Schema> LoadFromString(const std::string& yaml);
};

} // namespace annoschema::registry
