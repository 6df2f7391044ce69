#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/gc/orphan_collector.hpp"
#include "internal/gc/reference_graph.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using catalog::db::ErrorCode;
using catalog::db::Repository;
using catalog::db::Result;
using catalog::db::Transaction;
using catalog::db::memory::MemoryRepository;
using catalog::db::model::EntityRecord;
using catalog::db::model::FinalEntityRecord;
using catalog::db::model::kOrphanParentDeletedHash;
using catalog::db::model::ReferenceRecord;
using catalog::gc::CollectorOptions;
using catalog::gc::CollectStats;
using catalog::gc::OrphanCollector;
using catalog::gc::ReferenceGraph;

/*
  Wraps a MemoryRepository so tests can inject malformed rows and
  storage failures the real backends would never produce on demand.
*/
class FaultyRepository final : public Repository {
 public:
  explicit FaultyRepository(std::shared_ptr<Repository> inner) : inner_(std::move(inner)) {
  }

  std::optional<ErrorCode>             fail_delete;
  std::optional<ErrorCode>             fail_mark;
  std::vector<ReferenceRecord>         extra_references;
  std::size_t                          delete_calls = 0;
  std::vector<std::vector<std::string>> mark_batches;

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }

  Result InsertEntity(Transaction& t, const EntityRecord& e, const FinalEntityRecord& f) override {
    return inner_->InsertEntity(t, e, f);
  }
  std::optional<EntityRecord> GetEntity(Transaction& t, const std::string& ref) override {
    return inner_->GetEntity(t, ref);
  }
  std::vector<EntityRecord> ListEntities(Transaction& t) override {
    return inner_->ListEntities(t);
  }
  std::vector<std::string> ListEntityRefs(Transaction& t) override {
    return inner_->ListEntityRefs(t);
  }
  std::optional<FinalEntityRecord> GetFinalEntity(Transaction& t, const std::string& id) override {
    return inner_->GetFinalEntity(t, id);
  }
  Result DeleteEntities(Transaction& t, const std::vector<std::string>& refs) override {
    ++delete_calls;
    if (fail_delete) return Result::Err(*fail_delete, "injected delete failure");
    return inner_->DeleteEntities(t, refs);
  }
  Result MarkForReprocessing(Transaction& t, const std::vector<std::string>& refs, const std::string& hash) override {
    mark_batches.push_back(refs);
    if (fail_mark) return Result::Err(*fail_mark, "injected mark failure");
    return inner_->MarkForReprocessing(t, refs, hash);
  }
  Result InsertReference(Transaction& t, const ReferenceRecord& r) override {
    return inner_->InsertReference(t, r);
  }
  std::vector<ReferenceRecord> ListReferences(Transaction& t) override {
    auto refs = inner_->ListReferences(t);
    refs.insert(refs.end(), extra_references.begin(), extra_references.end());
    return refs;
  }
  Result DeleteReferencesFromSources(Transaction& t, const std::vector<std::string>& sources) override {
    return inner_->DeleteReferencesFromSources(t, sources);
  }
  Result DeleteReferencesToTargets(Transaction& t, const std::vector<std::string>& targets) override {
    return inner_->DeleteReferencesToTargets(t, targets);
  }

 private:
  std::shared_ptr<Repository> inner_;
};

void InsertEntities(Repository& repo, const std::vector<std::string>& refs) {
  auto tx = repo.Begin();
  for (const auto& ref : refs) {
    EntityRecord entity;
    entity.entity_id          = catalog::util::NewEntityId();
    entity.entity_ref         = ref;
    entity.unprocessed_entity = "{}";
    entity.processed_entity   = "{}";
    entity.errors             = "[]";
    entity.next_update_at     = "2021-04-01T13:37:00.000Z";
    entity.last_discovery_at  = "2021-04-01T13:37:00.000Z";
    entity.result_hash        = "original";

    FinalEntityRecord final_entity;
    final_entity.entity_id = entity.entity_id;
    final_entity.hash      = "original";

    assert(repo.InsertEntity(*tx, entity, final_entity));
  }
  tx->Commit();
}

void InsertReferences(Repository& repo, const std::vector<ReferenceRecord>& refs) {
  auto tx = repo.Begin();
  for (const auto& ref : refs) {
    assert(repo.InsertReference(*tx, ref));
  }
  tx->Commit();
}

CollectStats RunAndCommit(Repository& repo, OrphanCollector& collector) {
  auto tx    = repo.Begin();
  auto stats = collector.Run(*tx);
  tx->Commit();
  return stats;
}

std::vector<std::string> Refs(Repository& repo) {
  auto tx   = repo.Begin();
  auto refs = repo.ListEntityRefs(*tx);
  std::sort(refs.begin(), refs.end());
  return refs;
}

std::string ResultHash(Repository& repo, const std::string& ref) {
  auto tx     = repo.Begin();
  auto entity = repo.GetEntity(*tx, ref);
  assert(entity.has_value());
  return entity->result_hash;
}

std::string FinalHash(Repository& repo, const std::string& ref) {
  auto tx     = repo.Begin();
  auto entity = repo.GetEntity(*tx, ref);
  assert(entity.has_value());
  auto final_entity = repo.GetFinalEntity(*tx, entity->entity_id);
  assert(final_entity.has_value());
  return final_entity->hash;
}

void SeedMixedPaths(Repository& repo) {
  InsertEntities(repo, {"E1", "E2", "E3", "E4", "E5", "E6", "E7", "E8"});
  InsertReferences(repo, {
                             ReferenceRecord::Root("P1", "E1"),
                             ReferenceRecord::Internal("E1", "E2"),
                             ReferenceRecord::Internal("E3", "E2"),
                             ReferenceRecord::Internal("E4", "E3"),
                             ReferenceRecord::Internal("E4", "E5"),
                             ReferenceRecord::Internal("E6", "E5"),
                             ReferenceRecord::Internal("E6", "E7"),
                             ReferenceRecord::Root("P2", "E8"),
                             ReferenceRecord::Internal("E8", "E7"),
                         });
}

void TestMixedPathsDeletesOrphansAndMarksSurvivors() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedMixedPaths(*repo);

  OrphanCollector collector(repo);
  auto            tx = repo->Begin();
  assert(collector.Collect(*tx) == 4);
  tx->Commit();

  assert((Refs(*repo) == std::vector<std::string>{"E1", "E2", "E7", "E8"}));

  assert(ResultHash(*repo, "E1") == "original");
  assert(ResultHash(*repo, "E2") == kOrphanParentDeletedHash);
  assert(ResultHash(*repo, "E7") == kOrphanParentDeletedHash);
  assert(ResultHash(*repo, "E8") == "original");

  assert(FinalHash(*repo, "E1") == "original");
  assert(FinalHash(*repo, "E2") == kOrphanParentDeletedHash);
  assert(FinalHash(*repo, "E7") == kOrphanParentDeletedHash);
  assert(FinalHash(*repo, "E8") == "original");

  auto check = repo->Begin();
  assert(repo->GetEntity(*check, "E2")->needs_reprocessing);
  assert(!repo->GetEntity(*check, "E1")->needs_reprocessing);
  assert(repo->GetEntity(*check, "E2")->processed_entity == "{}");
}

void TestFinalRowsOfOrphansAreDeleted() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "B"});
  InsertReferences(*repo, {ReferenceRecord::Root("P", "A")});

  std::string orphan_id;
  {
    auto tx   = repo->Begin();
    orphan_id = repo->GetEntity(*tx, "B")->entity_id;
  }

  OrphanCollector collector(repo);
  assert(RunAndCommit(*repo, collector).deleted_entities == 1);

  auto tx = repo->Begin();
  assert(!repo->GetEntity(*tx, "B").has_value());
  assert(!repo->GetFinalEntity(*tx, orphan_id).has_value());
}

void TestSecondRunIsNoop() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedMixedPaths(*repo);

  OrphanCollector collector(repo);
  assert(RunAndCommit(*repo, collector).deleted_entities == 4);

  const auto before = Refs(*repo);
  const auto stats  = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 0);
  assert(stats.marked_entities == 0);
  assert(stats.pruned_references == 0);
  assert(Refs(*repo) == before);
}

void TestRootWithoutOtherSupportSurvives() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"root"});
  InsertReferences(*repo, {ReferenceRecord::Root("provider", "root")});

  OrphanCollector collector(repo);
  assert(RunAndCommit(*repo, collector).deleted_entities == 0);
  assert((Refs(*repo) == std::vector<std::string>{"root"}));
  assert(ResultHash(*repo, "root") == "original");
}

void TestDisconnectedCycleIsDeletedTogether() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"R", "X", "Y", "Z"});
  InsertReferences(*repo, {
                              ReferenceRecord::Root("P", "R"),
                              ReferenceRecord::Internal("X", "Y"),
                              ReferenceRecord::Internal("Y", "Z"),
                              ReferenceRecord::Internal("Z", "X"),
                          });

  OrphanCollector collector(repo);
  const auto      stats = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 3);
  assert(stats.marked_entities == 0);
  assert((Refs(*repo) == std::vector<std::string>{"R"}));
}

void TestEntitiesWithoutEdgesAreOrphans() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "B", "C"});

  OrphanCollector collector(repo);
  assert(RunAndCommit(*repo, collector).deleted_entities == 3);
  assert(Refs(*repo).empty());
}

void TestChildWithLiveParentIsStillMarked() {
  // C has a live parent A and a dead parent B
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "B", "C", "D"});
  InsertReferences(*repo, {
                              ReferenceRecord::Root("P", "A"),
                              ReferenceRecord::Internal("A", "C"),
                              ReferenceRecord::Internal("B", "C"),
                              ReferenceRecord::Internal("A", "D"),
                          });

  OrphanCollector collector(repo);
  const auto      stats = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 1);
  assert(stats.marked_entities == 1);
  assert(ResultHash(*repo, "C") == kOrphanParentDeletedHash);
  assert(ResultHash(*repo, "D") == "original");
  assert(ResultHash(*repo, "A") == "original");
}

void TestOrphanReferencesArePrunedByDefault() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedMixedPaths(*repo);

  OrphanCollector collector(repo);
  const auto      stats = RunAndCommit(*repo, collector);
  // E3->E2, E4->E3, E4->E5, E6->E5, E6->E7
  assert(stats.pruned_references == 5);

  auto tx         = repo->Begin();
  auto references = repo->ListReferences(*tx);
  assert(references.size() == 4);
  for (const auto& r : references) {
    if (r.source_entity_ref) {
      assert(*r.source_entity_ref == "E1" || *r.source_entity_ref == "E8");
    }
  }
}

void TestOrphanReferencesCanBeRetained() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedMixedPaths(*repo);

  CollectorOptions options;
  options.prune_orphan_references = false;
  OrphanCollector collector(repo, options);

  const auto stats = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 4);
  assert(stats.pruned_references == 0);

  {
    auto tx = repo->Begin();
    assert(repo->ListReferences(*tx).size() == 9);
  }

  // retained rows are now dangling: reported, but nothing else happens
  const auto second = RunAndCommit(*repo, collector);
  assert(second.deleted_entities == 0);
  assert(second.marked_entities == 0);
  assert(second.unknown_sources == 3); // E3, E4, E6
}

void TestStrictIntegrityRejectsUnknownSources() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "B"});
  InsertReferences(*repo, {
                              ReferenceRecord::Root("P", "A"),
                              ReferenceRecord::Internal("nobody", "B"),
                          });

  CollectorOptions strict;
  strict.strict_integrity = true;
  OrphanCollector strict_collector(repo, strict);

  {
    auto tx    = repo->Begin();
    bool threw = false;
    try {
      strict_collector.Run(*tx);
    } catch (const catalog::util::IntegrityViolation&) {
      threw = true;
    }
    assert(threw);
  }
  assert((Refs(*repo) == std::vector<std::string>{"A", "B"}));

  OrphanCollector lenient(repo);
  const auto      stats = RunAndCommit(*repo, lenient);
  assert(stats.unknown_sources == 1);
  assert(stats.deleted_entities == 1);
  assert(stats.pruned_references == 1);
  assert((Refs(*repo) == std::vector<std::string>{"A"}));

  // nobody->B went with B, so strict mode is satisfied afterwards
  const auto strict_again = RunAndCommit(*repo, strict_collector);
  assert(strict_again.unknown_sources == 0);
  assert(strict_again.deleted_entities == 0);
}

void TestMissingTargetsAreTolerated() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "C"});
  InsertReferences(*repo, {
                              ReferenceRecord::Root("P", "A"),
                              ReferenceRecord::Root("P", "ghost"),
                              ReferenceRecord::Internal("ghost", "C"),
                              ReferenceRecord::Internal("A", "gone"),
                          });

  OrphanCollector collector(repo);
  const auto      stats = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 0);
  assert(stats.missing_targets == 2);
  assert(stats.unknown_sources == 0);
  assert((Refs(*repo) == std::vector<std::string>{"A", "C"}));
}

void TestMalformedReferenceAborts() {
  auto inner = std::make_shared<MemoryRepository>();
  auto repo  = std::make_shared<FaultyRepository>(inner);
  InsertEntities(*repo, {"A", "B"});

  ReferenceRecord malformed = ReferenceRecord::Root("P", "A");
  malformed.source_entity_ref = "B";
  repo->extra_references.push_back(malformed);

  OrphanCollector collector(repo);
  auto            tx    = repo->Begin();
  bool            threw = false;
  try {
    collector.Collect(*tx);
  } catch (const catalog::util::IntegrityViolation&) {
    threw = true;
  }
  assert(threw);
  assert(repo->delete_calls == 0);
}

void TestStorageFailureLeavesStateUntouched() {
  auto inner = std::make_shared<MemoryRepository>();
  auto repo  = std::make_shared<FaultyRepository>(inner);
  SeedMixedPaths(*repo);
  repo->fail_mark = ErrorCode::IOError;

  OrphanCollector collector(repo);
  {
    auto tx    = repo->Begin();
    bool threw = false;
    try {
      collector.Collect(*tx);
    } catch (const catalog::util::StorageError&) {
      threw = true;
    }
    assert(threw);
    // tx destroyed without commit
  }

  assert(Refs(*repo).size() == 8);
  assert(ResultHash(*repo, "E2") == "original");
}

void TestRollbackDiscardsDeletionsAndMarks() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedMixedPaths(*repo);

  OrphanCollector collector(repo);
  {
    auto tx = repo->Begin();
    assert(collector.Collect(*tx) == 4);
    assert(repo->ListEntityRefs(*tx).size() == 4);
    tx->Rollback();
  }

  assert(Refs(*repo).size() == 8);
  assert(ResultHash(*repo, "E2") == "original");
  assert(FinalHash(*repo, "E7") == "original");
}

void TestSmallBatchesCoverEveryOrphan() {
  auto inner = std::make_shared<MemoryRepository>();
  auto repo  = std::make_shared<FaultyRepository>(inner);
  SeedMixedPaths(*repo);

  CollectorOptions options;
  options.batch_size = 1;
  OrphanCollector collector(repo, options);

  const auto stats = RunAndCommit(*repo, collector);
  assert(stats.deleted_entities == 4);
  assert(repo->delete_calls == 4);
  assert(repo->mark_batches.size() == 2);
  assert((Refs(*repo) == std::vector<std::string>{"E1", "E2", "E7", "E8"}));
}

void TestInboundEdgesFromUnknownSourcesArePruned() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A", "B"});
  InsertReferences(*repo, {
                              ReferenceRecord::Root("P", "A"),
                              ReferenceRecord::Internal("nobody", "B"),
                          });

  OrphanCollector collector(repo);
  const auto      first = RunAndCommit(*repo, collector);
  assert(first.deleted_entities == 1);
  assert(first.unknown_sources == 1);
  assert(first.pruned_references == 1);

  {
    auto tx         = repo->Begin();
    auto references = repo->ListReferences(*tx);
    assert(references.size() == 1);
    assert(references.front().IsRoot());
    assert(references.front().target_entity_ref == "A");
  }

  const auto second = RunAndCommit(*repo, collector);
  assert(second.deleted_entities == 0);
  assert(second.unknown_sources == 0);
  assert(second.pruned_references == 0);
}

void TestStrictIntegrityRequiresPruning() {
  auto repo = std::make_shared<MemoryRepository>();

  CollectorOptions options;
  options.prune_orphan_references = false;
  options.strict_integrity        = true;

  bool threw = false;
  try {
    OrphanCollector collector(repo, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  options.prune_orphan_references = true;
  OrphanCollector collector(repo, options);
}

void TestFinishedTransactionRejectsReads() {
  auto repo = std::make_shared<MemoryRepository>();
  InsertEntities(*repo, {"A"});

  auto rolled_back = repo->Begin();
  rolled_back->Rollback();
  bool threw = false;
  try {
    (void)repo->ListEntityRefs(*rolled_back);
  } catch (const catalog::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  auto committed = repo->Begin();
  committed->Commit();
  threw = false;
  try {
    (void)repo->GetEntity(*committed, "A");
  } catch (const catalog::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestRandomGraphsDeleteExactlyTheUnreachable() {
  for (unsigned seed = 1; seed <= 25; ++seed) {
    std::mt19937                       rng(seed);
    std::uniform_int_distribution<int> entity_count(4, 24);
    std::uniform_int_distribution<int> percent(0, 99);

    const int                n = entity_count(rng);
    std::vector<std::string> entities;
    for (int i = 0; i < n; ++i) {
      entities.push_back("N" + std::to_string(i));
    }

    std::uniform_int_distribution<int> pick(0, n - 1);
    std::vector<ReferenceRecord>       references;
    for (const auto& ref : entities) {
      if (percent(rng) < 20) references.push_back(ReferenceRecord::Root("P", ref));
    }
    const int edges = 2 * n;
    for (int i = 0; i < edges; ++i) {
      // a few edges hang off refs that have no entity row
      const auto source = percent(rng) < 10 ? "ext" + std::to_string(pick(rng)) : entities[pick(rng)];
      references.push_back(ReferenceRecord::Internal(source, entities[pick(rng)]));
    }

    const ReferenceGraph graph(references);
    const auto           reachable = graph.Reachable();

    std::vector<std::string>        expected_survivors;
    std::unordered_set<std::string> orphans;
    for (const auto& ref : entities) {
      if (reachable.contains(ref)) {
        expected_survivors.push_back(ref);
      } else {
        orphans.insert(ref);
      }
    }
    std::sort(expected_survivors.begin(), expected_survivors.end());

    std::unordered_set<std::string> expected_marked;
    for (const auto& orphan : orphans) {
      for (const auto& child : graph.Children(orphan)) {
        if (!orphans.contains(child)) expected_marked.insert(child);
      }
    }

    auto repo = std::make_shared<MemoryRepository>();
    InsertEntities(*repo, entities);
    InsertReferences(*repo, references);

    OrphanCollector collector(repo);
    std::size_t     deleted = 0;
    {
      auto tx = repo->Begin();
      deleted = collector.Collect(*tx);
      tx->Commit();
    }

    assert(deleted == orphans.size());
    assert(Refs(*repo) == expected_survivors);

    {
      auto tx = repo->Begin();
      for (const auto& ref : expected_survivors) {
        auto entity = repo->GetEntity(*tx, ref);
        assert(entity.has_value());
        assert(entity->needs_reprocessing == expected_marked.contains(ref));
      }
      for (const auto& r : repo->ListReferences(*tx)) {
        if (r.IsRoot()) continue;
        assert(!orphans.contains(*r.source_entity_ref));
        assert(!orphans.contains(r.target_entity_ref));
      }
    }

    const auto again = RunAndCommit(*repo, collector);
    assert(again.deleted_entities == 0);
    assert(again.marked_entities == 0);
    assert(again.pruned_references == 0);
  }
}

} // namespace

int main() {
  TestMixedPathsDeletesOrphansAndMarksSurvivors();
  TestFinalRowsOfOrphansAreDeleted();
  TestSecondRunIsNoop();
  TestRootWithoutOtherSupportSurvives();
  TestDisconnectedCycleIsDeletedTogether();
  TestEntitiesWithoutEdgesAreOrphans();
  TestChildWithLiveParentIsStillMarked();
  TestOrphanReferencesArePrunedByDefault();
  TestOrphanReferencesCanBeRetained();
  TestStrictIntegrityRejectsUnknownSources();
  TestMissingTargetsAreTolerated();
  TestMalformedReferenceAborts();
  TestStorageFailureLeavesStateUntouched();
  TestRollbackDiscardsDeletionsAndMarks();
  TestSmallBatchesCoverEveryOrphan();
  TestInboundEdgesFromUnknownSourcesArePruned();
  TestStrictIntegrityRequiresPruning();
  TestFinishedTransactionRejectsReads();
  TestRandomGraphsDeleteExactlyTheUnreachable();

  std::cout << "catalog_gc_unit_orphan_collector: pass\n";
  return 0;
}
