#pragma once

#include <string>

namespace catalog::db::model {

/*
  Persistent entity row (table: entities).

  IMPORTANT:
  - entity_id and entity_ref are immutable once written.
  - Payload columns are opaque to the collector; only result_hash and
    needs_reprocessing are ever rewritten by it.
*/

// Written to result_hash (and final_entities.hash) of a surviving entity
// when one of its direct parents was deleted as an orphan.
inline constexpr const char* kOrphanParentDeletedHash = "orphan-parent-deleted";

struct EntityRecord {
  std::string entity_id;
  std::string entity_ref;

  std::string unprocessed_entity;
  std::string processed_entity;
  std::string errors;

  // scheduling timestamps (ISO-8601 text, owned by the processing loop)
  std::string next_update_at;
  std::string last_discovery_at;

  std::string result_hash;

  bool needs_reprocessing = false;
};

} // namespace catalog::db::model
