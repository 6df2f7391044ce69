#pragma once

#include <optional>
#include <string>
#include <utility>

namespace catalog::db::model {

/*
  Directed edge in the reference graph (table: reference_edges).

  Exactly one source column is set:

    source_key        ---> target   (root edge, provider asserts target)
    source_entity_ref ---> target   (internal edge, source depends on target)
*/

struct ReferenceRecord {
  std::optional<std::string> source_key;
  std::optional<std::string> source_entity_ref;
  std::string                target_entity_ref;

  bool IsRoot() const {
    return source_key.has_value();
  }

  static ReferenceRecord Root(std::string key, std::string target) {
    ReferenceRecord r;
    r.source_key        = std::move(key);
    r.target_entity_ref = std::move(target);
    return r;
  }

  static ReferenceRecord Internal(std::string source, std::string target) {
    ReferenceRecord r;
    r.source_entity_ref = std::move(source);
    r.target_entity_ref = std::move(target);
    return r;
  }
};

} // namespace catalog::db::model
