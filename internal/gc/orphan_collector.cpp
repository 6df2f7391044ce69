#include "internal/gc/orphan_collector.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/model/entity_record.hpp"
#include "internal/gc/reference_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace catalog::gc {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kDefaultBatchSize = 500;
constexpr std::size_t kMaxReportedRefs  = 5;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
  }
}

template <typename Fn>
void ForEachBatch(const std::vector<std::string>& refs, std::size_t batch_size, Fn&& fn) {
  for (std::size_t begin = 0; begin < refs.size(); begin += batch_size) {
    const auto end = std::min(refs.size(), begin + batch_size);
    fn(std::vector<std::string>(refs.begin() + begin, refs.begin() + end));
  }
}

std::string JoinSample(const std::vector<std::string>& refs) {
  std::string out;
  for (std::size_t i = 0; i < refs.size() && i < kMaxReportedRefs; ++i) {
    if (i > 0) out += ',';
    out += refs[i];
  }
  if (refs.size() > kMaxReportedRefs) out += ",...";
  return out;
}

} // namespace

CollectorOptions CollectorOptions::FromConfig(const catalog::runtime::config::CollectorConfig& config) {
  CollectorOptions options;
  options.prune_orphan_references = !config.retain_orphan_references();
  options.strict_integrity        = config.strict_integrity();
  options.batch_size              = config.delete_batch_size() == 0 ? kDefaultBatchSize : config.delete_batch_size();
  options.Validate();
  return options;
}

void CollectorOptions::Validate() const {
  // retained edges of deleted entities become unknown sources on the next run
  if (strict_integrity && !prune_orphan_references) {
    throw std::invalid_argument("strict_integrity cannot be combined with retain_orphan_references");
  }
}

OrphanCollector::OrphanCollector(std::shared_ptr<db::Repository> repository, CollectorOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("orphan collector requires a repository");
  }
  options_.Validate();
  if (options_.batch_size == 0) {
    options_.batch_size = kDefaultBatchSize;
  }
}

std::size_t OrphanCollector::Collect(db::Transaction& tx) {
  return Run(tx).deleted_entities;
}

CollectStats OrphanCollector::Run(db::Transaction& tx) {
  const auto started = util::Now();
  CollectStats stats;

  // ------------------------------------------------------------------
  // Snapshot
  // ------------------------------------------------------------------
  const auto entity_refs = repository_->ListEntityRefs(tx);
  const ReferenceGraph graph(repository_->ListReferences(tx));

  const std::unordered_set<std::string> entities(entity_refs.begin(), entity_refs.end());

  // ------------------------------------------------------------------
  // Mark
  // ------------------------------------------------------------------
  const auto reachable = graph.Reachable();
  stats.reachable_refs = reachable.size();

  std::vector<std::string> orphans;
  for (const auto& ref : entity_refs) {
    if (!reachable.contains(ref)) {
      orphans.push_back(ref);
    }
  }
  std::sort(orphans.begin(), orphans.end());
  const std::unordered_set<std::string> orphan_set(orphans.begin(), orphans.end());

  // ------------------------------------------------------------------
  // Integrity report
  // ------------------------------------------------------------------
  std::vector<std::string> unknown_sources;
  std::unordered_set<std::string> missing_targets;
  for (const auto& [source, targets] : graph.Edges()) {
    if (!entities.contains(source) && !reachable.contains(source)) {
      unknown_sources.push_back(source);
    }
    for (const auto& target : targets) {
      if (!entities.contains(target)) missing_targets.insert(target);
    }
  }
  for (const auto& target : graph.RootTargets()) {
    if (!entities.contains(target)) missing_targets.insert(target);
  }
  std::sort(unknown_sources.begin(), unknown_sources.end());
  stats.unknown_sources = unknown_sources.size();
  stats.missing_targets = missing_targets.size();

  if (!unknown_sources.empty()) {
    if (options_.strict_integrity) {
      throw util::IntegrityViolation("references originate from " + std::to_string(unknown_sources.size()) +
                                     " unknown unreachable source(s): " + JoinSample(unknown_sources));
    }
    CATALOG_LOG_WARN("references from unknown sources ignored",
                     {IntField("count", static_cast<std::int64_t>(unknown_sources.size())), StringField("sample", JoinSample(unknown_sources))});
  }
  if (!missing_targets.empty()) {
    CATALOG_LOG_WARN("references point at refs without entity rows", {IntField("count", static_cast<std::int64_t>(missing_targets.size()))});
  }

  // ------------------------------------------------------------------
  // Sweep
  // ------------------------------------------------------------------
  ForEachBatch(orphans, options_.batch_size, [&](const std::vector<std::string>& batch) {
    ThrowIfDbError(repository_->DeleteEntities(tx, batch), "delete orphaned entities");
  });
  stats.deleted_entities = orphans.size();

  // any deleted parent is enough, live parents elsewhere do not matter
  std::unordered_set<std::string> children_to_mark;
  for (const auto& orphan : orphans) {
    for (const auto& child : graph.Children(orphan)) {
      if (!orphan_set.contains(child) && entities.contains(child)) {
        children_to_mark.insert(child);
      }
    }
  }

  // internal edges leaving or entering an orphan
  for (const auto& [source, targets] : graph.Edges()) {
    for (const auto& target : targets) {
      if (orphan_set.contains(source) || orphan_set.contains(target)) {
        ++stats.pruned_references;
      }
    }
  }

  std::vector<std::string> marked(children_to_mark.begin(), children_to_mark.end());
  std::sort(marked.begin(), marked.end());
  ForEachBatch(marked, options_.batch_size, [&](const std::vector<std::string>& batch) {
    ThrowIfDbError(repository_->MarkForReprocessing(tx, batch, db::model::kOrphanParentDeletedHash), "mark children of orphaned entities");
  });
  stats.marked_entities = marked.size();

  if (options_.prune_orphan_references) {
    ForEachBatch(orphans, options_.batch_size, [&](const std::vector<std::string>& batch) {
      ThrowIfDbError(repository_->DeleteReferencesFromSources(tx, batch), "prune references of orphaned entities");
      ThrowIfDbError(repository_->DeleteReferencesToTargets(tx, batch), "prune references into orphaned entities");
    });
  } else {
    stats.pruned_references = 0;
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started).count();
  CATALOG_LOG_INFO("orphan collection finished",
                   {IntField("entities", static_cast<std::int64_t>(entity_refs.size())),
                    IntField("references", static_cast<std::int64_t>(graph.RootEdgeCount() + graph.InternalEdgeCount())),
                    IntField("reachable", static_cast<std::int64_t>(stats.reachable_refs)),
                    IntField("deleted", static_cast<std::int64_t>(stats.deleted_entities)),
                    IntField("marked", static_cast<std::int64_t>(stats.marked_entities)),
                    IntField("pruned_references", static_cast<std::int64_t>(stats.pruned_references)),
                    IntField("elapsed_ms", static_cast<std::int64_t>(elapsed_ms))});

  return stats;
}

} // namespace catalog::gc
