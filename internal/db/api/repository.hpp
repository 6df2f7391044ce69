#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/final_entity_record.hpp"
#include "internal/db/model/reference_record.hpp"

namespace catalog::db {

/*
  Repository abstraction over the entity store and the reference graph.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Writes report failures through Result
  - Reads throw util::StorageError (or the driver exception) on failure;
    an empty result always means "no rows"

  The DB is the source of truth for:
    entities
    final entities
    reference edges
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  // Inserts the entity row and its final row in one step.
  virtual Result InsertEntity(Transaction&, const model::EntityRecord&, const model::FinalEntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& entity_ref) = 0;

  virtual std::vector<model::EntityRecord> ListEntities(Transaction&) = 0;

  virtual std::vector<std::string> ListEntityRefs(Transaction&) = 0;

  virtual std::optional<model::FinalEntityRecord> GetFinalEntity(Transaction&, const std::string& entity_id) = 0;

  // Deletes entity rows and their final rows. Unknown refs are ignored.
  virtual Result DeleteEntities(Transaction&, const std::vector<std::string>& entity_refs) = 0;

  // Sets result_hash and final hash to `marker_hash` and raises needs_reprocessing.
  // Payload columns are left untouched. Unknown refs are ignored.
  virtual Result MarkForReprocessing(Transaction&, const std::vector<std::string>& entity_refs, const std::string& marker_hash) = 0;

  // ---------------------------------------------------------------------
  // Reference edges
  // ---------------------------------------------------------------------

  virtual Result InsertReference(Transaction&, const model::ReferenceRecord&) = 0;

  virtual std::vector<model::ReferenceRecord> ListReferences(Transaction&) = 0;

  // Removes internal edges whose source_entity_ref is in `source_refs`.
  virtual Result DeleteReferencesFromSources(Transaction&, const std::vector<std::string>& source_refs) = 0;

  // Removes internal edges whose target_entity_ref is in `target_refs`.
  // Root edges are kept.
  virtual Result DeleteReferencesToTargets(Transaction&, const std::vector<std::string>& target_refs) = 0;
};

} // namespace catalog::db
