#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/table.hpp"

namespace annoschema::cache {

using ModelPtr = std::shared_ptr<const model::TableDefinition>;

/*
  ModelCache

  Memoizes compiled tables by canonical name for the lifetime of the
  cache. A key is compiled at most once: concurrent callers for a key
  that is being compiled block until the compiler finishes. A failed
  compilation stores nothing; the next caller retries.

  No eviction. A schema whose shape changes must get a new version.
*/
class ModelCache {
 public:
  using CompileFn = std::function<model::TableDefinition()>;

  ModelPtr GetOrCompile(std::string_view dataset, std::string_view table_name, model::Version version,
                        const CompileFn& compile);

  std::optional<ModelPtr> Get(std::string_view dataset, std::string_view table_name, model::Version version) const;

  bool Contains(std::string_view dataset, std::string_view table_name, model::Version version) const;

  std::size_t Size() const;

 private:
  static std::string Key(std::string_view dataset, std::string_view table_name, model::Version version);

  mutable std::shared_mutex   mutex_;
  std::condition_variable_any compiled_;

  std::unordered_map<std::string, ModelPtr> models_;
  std::unordered_set<std::string>           in_flight_;
};

} // namespace annoschema::cache
