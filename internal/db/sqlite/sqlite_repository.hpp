#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace catalog::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace catalog::db::sqlite
