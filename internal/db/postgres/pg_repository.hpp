#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace catalog::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace catalog::db::postgres
