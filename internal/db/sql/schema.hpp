#pragma once

#include <string>
#include <vector>

namespace catalog::db::sql {

/*
  Idempotent bootstrap DDL.

  reference_edges deliberately has no foreign key on source_entity_ref:
  pruning edges of deleted entities is the collector's decision, and
  provider-less dangling rows must stay observable.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS entities (entity_id TEXT PRIMARY KEY, entity_ref TEXT NOT NULL UNIQUE, unprocessed_entity TEXT, "
      "processed_entity TEXT, errors TEXT, next_update_at TEXT, last_discovery_at TEXT, result_hash TEXT, "
      "needs_reprocessing INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS final_entities (entity_id TEXT PRIMARY KEY REFERENCES entities(entity_id) ON DELETE CASCADE, "
      "hash TEXT NOT NULL, stitch_ticket TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reference_edges (id INTEGER PRIMARY KEY AUTOINCREMENT, source_key TEXT, source_entity_ref TEXT, "
      "target_entity_ref TEXT NOT NULL, CHECK ((source_key IS NULL) <> (source_entity_ref IS NULL)));",
      "CREATE INDEX IF NOT EXISTS reference_edges_source_entity_ref_idx ON reference_edges(source_entity_ref);",
      "CREATE INDEX IF NOT EXISTS reference_edges_target_entity_ref_idx ON reference_edges(target_entity_ref);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS entities (entity_id TEXT PRIMARY KEY, entity_ref TEXT NOT NULL UNIQUE, unprocessed_entity TEXT, "
      "processed_entity TEXT, errors TEXT, next_update_at TEXT, last_discovery_at TEXT, result_hash TEXT, "
      "needs_reprocessing BOOLEAN NOT NULL DEFAULT FALSE);",
      "CREATE TABLE IF NOT EXISTS final_entities (entity_id TEXT PRIMARY KEY REFERENCES entities(entity_id) ON DELETE CASCADE, "
      "hash TEXT NOT NULL, stitch_ticket TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reference_edges (id BIGSERIAL PRIMARY KEY, source_key TEXT, source_entity_ref TEXT, "
      "target_entity_ref TEXT NOT NULL, CHECK ((source_key IS NULL) <> (source_entity_ref IS NULL)));",
      "CREATE INDEX IF NOT EXISTS reference_edges_source_entity_ref_idx ON reference_edges(source_entity_ref);",
      "CREATE INDEX IF NOT EXISTS reference_edges_target_entity_ref_idx ON reference_edges(target_entity_ref);"};
  return kSchema;
}

} // namespace catalog::db::sql
