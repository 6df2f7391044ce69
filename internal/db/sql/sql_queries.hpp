#pragma once

namespace catalog::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  IMPORTANT:
  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements; keep the column order identical.
*/

// entities

static constexpr const char* INSERT_ENTITY =
    "INSERT INTO entities(entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
    "next_update_at,last_discovery_at,result_hash,needs_reprocessing)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_FINAL_ENTITY =
    "INSERT INTO final_entities(entity_id,hash,stitch_ticket) VALUES(?,?,?);";

static constexpr const char* SELECT_ENTITY =
    "SELECT entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
    "next_update_at,last_discovery_at,result_hash,needs_reprocessing"
    " FROM entities WHERE entity_ref=?;";

static constexpr const char* SELECT_ENTITIES =
    "SELECT entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
    "next_update_at,last_discovery_at,result_hash,needs_reprocessing"
    " FROM entities ORDER BY entity_ref;";

static constexpr const char* SELECT_ENTITY_REFS =
    "SELECT entity_ref FROM entities;";

static constexpr const char* SELECT_FINAL_ENTITY =
    "SELECT entity_id,hash,stitch_ticket FROM final_entities WHERE entity_id=?;";

static constexpr const char* DELETE_FINAL_ENTITY_BY_REF =
    "DELETE FROM final_entities WHERE entity_id IN"
    " (SELECT entity_id FROM entities WHERE entity_ref=?);";

static constexpr const char* DELETE_ENTITY_BY_REF =
    "DELETE FROM entities WHERE entity_ref=?;";

static constexpr const char* MARK_ENTITY =
    "UPDATE entities SET result_hash=?,needs_reprocessing=1 WHERE entity_ref=?;";

static constexpr const char* MARK_FINAL_ENTITY =
    "UPDATE final_entities SET hash=? WHERE entity_id IN"
    " (SELECT entity_id FROM entities WHERE entity_ref=?);";

// reference edges

static constexpr const char* INSERT_REFERENCE =
    "INSERT INTO reference_edges(source_key,source_entity_ref,target_entity_ref) VALUES(?,?,?);";

static constexpr const char* SELECT_REFERENCES =
    "SELECT source_key,source_entity_ref,target_entity_ref FROM reference_edges ORDER BY id;";

static constexpr const char* DELETE_REFERENCES_FROM_SOURCE =
    "DELETE FROM reference_edges WHERE source_entity_ref=?;";

static constexpr const char* DELETE_REFERENCES_TO_TARGET =
    "DELETE FROM reference_edges WHERE source_entity_ref IS NOT NULL AND target_entity_ref=?;";

} // namespace catalog::db::sql
