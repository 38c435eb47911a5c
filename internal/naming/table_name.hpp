#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/table.hpp"

namespace annoschema::naming {

/*
  Canonical table names: "{dataset}_{table}_v{version}".

  Dataset and table segments must not end in a "_v<digits>" pattern of
  their own; that is a caller contract and is not validated here.
*/

std::string EncodeTableName(std::string_view dataset, std::string_view table, model::Version version);

// Parses the trailing "v<int>" segment. Throws util::MalformedNameError.
model::Version DecodeVersion(std::string_view canonical_name);

// max(version of every name containing dataset) + 1, or 0 if none match.
model::Version NextVersion(const std::vector<std::string>& existing_names, std::string_view dataset);

// "pinky" -> "Pinky", "SYNAPSE" -> "Synapse"
std::string Capitalize(std::string_view word);

} // namespace annoschema::naming
