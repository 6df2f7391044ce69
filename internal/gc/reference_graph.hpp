#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/model/reference_record.hpp"

namespace catalog::gc {

/*
  In-memory snapshot of reference_edges.

  Built once per collection from ListReferences(); the traversal never
  touches storage, so every backend shares the same algorithm.

      root edge:      provider key ---> target
      internal edge:  source ref   ---> target
*/
class ReferenceGraph {
 public:
  using RefSet = std::unordered_set<std::string>;

  ReferenceGraph() = default;
  explicit ReferenceGraph(const std::vector<db::model::ReferenceRecord>& references);

  // Throws util::IntegrityViolation for rows with zero or two sources,
  // or with an empty target.
  void Add(const db::model::ReferenceRecord& reference);

  // Every reference reachable from a root target by following internal
  // edges forward. Each reference is expanded at most once, so cycles
  // terminate. Refs without an entity row are traversed like any other.
  RefSet Reachable() const;

  // Direct targets of internal edges leaving `source` (duplicates kept).
  const std::vector<std::string>& Children(const std::string& source) const;

  const std::vector<std::string>& RootTargets() const {
    return root_targets_;
  }

  // source ref -> targets, for every internal edge
  const std::unordered_map<std::string, std::vector<std::string>>& Edges() const {
    return children_;
  }

  std::size_t RootEdgeCount() const {
    return root_targets_.size();
  }

  std::size_t InternalEdgeCount() const {
    return internal_edges_;
  }

 private:
  std::vector<std::string>                                  root_targets_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::size_t                                               internal_edges_ = 0;
};

} // namespace catalog::gc
