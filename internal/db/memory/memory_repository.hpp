#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace catalog::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntity(Transaction&, const model::EntityRecord&, const model::FinalEntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& entity_ref) override;
  std::vector<model::EntityRecord> ListEntities(Transaction&) override;
  std::vector<std::string> ListEntityRefs(Transaction&) override;
  std::optional<model::FinalEntityRecord> GetFinalEntity(Transaction&, const std::string& entity_id) override;
  Result DeleteEntities(Transaction&, const std::vector<std::string>& entity_refs) override;
  Result MarkForReprocessing(Transaction&, const std::vector<std::string>& entity_refs,
                             const std::string& marker_hash) override;

  Result InsertReference(Transaction&, const model::ReferenceRecord&) override;
  std::vector<model::ReferenceRecord> ListReferences(Transaction&) override;
  Result DeleteReferencesFromSources(Transaction&, const std::vector<std::string>& source_refs) override;
  Result DeleteReferencesToTargets(Transaction&, const std::vector<std::string>& target_refs) override;

private:
  friend class MemoryTransaction;

  struct State {
    // keyed by entity_ref; ordered so listings are deterministic
    std::map<std::string, model::EntityRecord> entities;
    std::unordered_map<std::string, std::string> ref_by_id;
    std::unordered_map<std::string, model::FinalEntityRecord> final_entities;
    std::vector<model::ReferenceRecord> references;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace catalog::db::memory
