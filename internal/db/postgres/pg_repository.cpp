#include "pg_repository.hpp"

#include <string>

namespace catalog::db::postgres {

namespace {

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.entity_id          = row[0].c_str();
  r.entity_ref         = row[1].c_str();
  r.unprocessed_entity = row[2].is_null() ? "" : row[2].c_str();
  r.processed_entity   = row[3].is_null() ? "" : row[3].c_str();
  r.errors             = row[4].is_null() ? "" : row[4].c_str();
  r.next_update_at     = row[5].is_null() ? "" : row[5].c_str();
  r.last_discovery_at  = row[6].is_null() ? "" : row[6].c_str();
  r.result_hash        = row[7].is_null() ? "" : row[7].c_str();
  r.needs_reprocessing = row[8].as<bool>();
  return r;
}

// "('a','b',...)" with every element escaped by the server's rules
std::string QuotedList(pqxx::work& w, const std::vector<std::string>& values) {
  std::string out = "(";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ',';
    out += w.quote(values[i]);
  }
  out += ')';
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& e, const model::FinalEntityRecord& f) {
  if (f.entity_id != e.entity_id) {
    return Result::Err(ErrorCode::ConstraintViolation, "final entity must share entity_id");
  }

  try {
    auto& w = TX(t).Work();
    w.exec_prepared("insert_entity", e.entity_id, e.entity_ref, e.unprocessed_entity, e.processed_entity, e.errors, e.next_update_at,
                    e.last_discovery_at, e.result_hash, e.needs_reprocessing);
    w.exec_prepared("insert_final_entity", f.entity_id, f.hash, f.stitch_ticket);
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& entity_ref) {
  auto res = TX(t).Work().exec_prepared("get_entity", entity_ref);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0]);
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
      "next_update_at,last_discovery_at,result_hash,needs_reprocessing "
      "FROM entities ORDER BY entity_ref;");

  std::vector<model::EntityRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadEntity(row));
  }
  return records;
}

std::vector<std::string> PgRepository::ListEntityRefs(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT entity_ref FROM entities;");

  std::vector<std::string> refs;
  refs.reserve(res.size());
  for (const auto& row : res) {
    refs.emplace_back(row[0].c_str());
  }
  return refs;
}

std::optional<model::FinalEntityRecord> PgRepository::GetFinalEntity(Transaction& t, const std::string& entity_id) {
  auto res = TX(t).Work().exec_prepared("get_final_entity", entity_id);
  if (res.empty()) return std::nullopt;

  model::FinalEntityRecord r;
  r.entity_id     = res[0][0].c_str();
  r.hash          = res[0][1].c_str();
  r.stitch_ticket = res[0][2].c_str();
  return r;
}

Result PgRepository::DeleteEntities(Transaction& t, const std::vector<std::string>& entity_refs) {
  if (entity_refs.empty()) return Result::Ok();

  try {
    auto&      w    = TX(t).Work();
    const auto refs = QuotedList(w, entity_refs);
    w.exec("DELETE FROM final_entities WHERE entity_id IN (SELECT entity_id FROM entities WHERE entity_ref IN " + refs + ");");
    w.exec("DELETE FROM entities WHERE entity_ref IN " + refs + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::MarkForReprocessing(Transaction& t, const std::vector<std::string>& entity_refs, const std::string& marker_hash) {
  if (entity_refs.empty()) return Result::Ok();

  try {
    auto&      w    = TX(t).Work();
    const auto refs = QuotedList(w, entity_refs);
    const auto hash = w.quote(marker_hash);
    w.exec("UPDATE final_entities SET hash=" + hash + " WHERE entity_id IN (SELECT entity_id FROM entities WHERE entity_ref IN " + refs + ");");
    w.exec("UPDATE entities SET result_hash=" + hash + ",needs_reprocessing=TRUE WHERE entity_ref IN " + refs + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Reference edges
// ------------------------------------------------------------------

Result PgRepository::InsertReference(Transaction& t, const model::ReferenceRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_reference", r.source_key, r.source_entity_ref, r.target_entity_ref);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReferenceRecord> PgRepository::ListReferences(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT source_key,source_entity_ref,target_entity_ref FROM reference_edges ORDER BY id;");

  std::vector<model::ReferenceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ReferenceRecord r;
    if (!row[0].is_null()) r.source_key = row[0].c_str();
    if (!row[1].is_null()) r.source_entity_ref = row[1].c_str();
    r.target_entity_ref = row[2].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteReferencesFromSources(Transaction& t, const std::vector<std::string>& source_refs) {
  if (source_refs.empty()) return Result::Ok();

  try {
    auto& w = TX(t).Work();
    w.exec("DELETE FROM reference_edges WHERE source_entity_ref IN " + QuotedList(w, source_refs) + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReferencesToTargets(Transaction& t, const std::vector<std::string>& target_refs) {
  if (target_refs.empty()) return Result::Ok();

  try {
    auto& w = TX(t).Work();
    w.exec("DELETE FROM reference_edges WHERE source_entity_ref IS NOT NULL AND target_entity_ref IN " +
           QuotedList(w, target_refs) + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace catalog::db::postgres
