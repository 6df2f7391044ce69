#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace catalog::runtime::config {
class CollectorConfig;
}

namespace catalog::gc {

struct CollectorOptions {
  // Delete internal reference_edges rows that start or end at a collected entity.
  bool prune_orphan_references = true;

  // Throw util::IntegrityViolation when an internal edge has a source that
  // is neither an entity nor reachable from a root. Requires pruning.
  bool strict_integrity = false;

  // Refs per repository delete/mark call.
  std::size_t batch_size = 500;

  static CollectorOptions FromConfig(const catalog::runtime::config::CollectorConfig& config);

  // Throws std::invalid_argument for strict_integrity without pruning.
  void Validate() const;
};

struct CollectStats {
  std::size_t deleted_entities   = 0;
  std::size_t marked_entities    = 0;
  std::size_t pruned_references  = 0;
  std::size_t reachable_refs     = 0;
  std::size_t unknown_sources    = 0; // internal edge sources with no entity and no root path
  std::size_t missing_targets    = 0; // edge targets with no entity row
};

/*
  Mark-and-sweep over the persisted reference graph.

  Everything happens through the caller's transaction:

    load refs + edges -> reachable -> orphans = refs - reachable
      -> delete orphans (entities + final_entities)
      -> mark direct surviving children of orphans for reprocessing
      -> prune internal edges from or into orphans (unless retained)

  The collector never commits or rolls back. Any failure is thrown and the
  caller must discard the transaction; counts are provisional until commit.
*/
class OrphanCollector {
 public:
  explicit OrphanCollector(std::shared_ptr<db::Repository> repository, CollectorOptions options = {});

  // Number of entities deleted.
  std::size_t Collect(db::Transaction& tx);

  CollectStats Run(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository> repository_;
  CollectorOptions                options_;
};

} // namespace catalog::gc
