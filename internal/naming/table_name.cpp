#include "internal/naming/table_name.hpp"

#include <cctype>
#include <charconv>
#include <limits>

#include "internal/util/errors.hpp"

namespace annoschema::naming {

std::string EncodeTableName(std::string_view dataset, std::string_view table, model::Version version) {
  std::string name;
  name.reserve(dataset.size() + table.size() + 16);
  name.append(dataset);
  name.push_back('_');
  name.append(table);
  name.append("_v");
  name.append(std::to_string(version));
  return name;
}

model::Version DecodeVersion(std::string_view canonical_name) {
  const auto sep = canonical_name.rfind('_');
  if (sep == std::string_view::npos) {
    throw util::MalformedNameError(std::string(canonical_name), "missing version segment");
  }

  auto segment = canonical_name.substr(sep + 1);
  if (segment.size() < 2 || segment.front() != 'v') {
    throw util::MalformedNameError(std::string(canonical_name), "version segment must be v<int>");
  }
  segment.remove_prefix(1);

  // Leading zeros decode (v01 -> 1); EncodeTableName never emits them.

  model::Version version = 0;
  const auto* first      = segment.data();
  const auto* last       = segment.data() + segment.size();
  auto [ptr, ec]         = std::from_chars(first, last, version);
  if (ec != std::errc() || ptr != last) {
    throw util::MalformedNameError(std::string(canonical_name), "version is not a non-negative integer");
  }
  return version;
}

model::Version NextVersion(const std::vector<std::string>& existing_names, std::string_view dataset) {
  const std::string* latest_name = nullptr;
  model::Version     latest      = 0;

  for (const auto& name : existing_names) {
    if (name.find(dataset) == std::string::npos) continue;

    const auto version = DecodeVersion(name);
    if (!latest_name || version > latest) {
      latest      = version;
      latest_name = &name;
    }
  }

  if (!latest_name) return 0;
  if (latest == std::numeric_limits<model::Version>::max()) {
    throw util::MalformedNameError(*latest_name, "version space exhausted");
  }
  return latest + 1;
}

std::string Capitalize(std::string_view word) {
  std::string out(word);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const auto c = static_cast<unsigned char>(out[i]);
    out[i]       = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
  }
  return out;
}

} // namespace annoschema::naming
