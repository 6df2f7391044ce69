#include "memory_repository.hpp"

#include <unordered_set>

#include "memory_tx.hpp"

namespace catalog::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& e, const model::FinalEntityRecord& f) {
  auto& s = TX(t).Mutable();
  if (e.entity_id.empty() || e.entity_ref.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "entity_id and entity_ref are required");
  }
  if (f.entity_id != e.entity_id) {
    return Result::Err(ErrorCode::ConstraintViolation, "final entity must share entity_id");
  }
  if (s.entities.contains(e.entity_ref) || s.ref_by_id.contains(e.entity_id)) {
    return Result::Err(ErrorCode::AlreadyExists, e.entity_ref);
  }

  s.entities[e.entity_ref]      = e;
  s.ref_by_id[e.entity_id]      = e.entity_ref;
  s.final_entities[e.entity_id] = f;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& entity_ref) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(entity_ref);
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::EntityRecord> records;
  records.reserve(s.entities.size());
  for (const auto& [_, record] : s.entities) {
    records.push_back(record);
  }
  return records;
}

std::vector<std::string> MemoryRepository::ListEntityRefs(Transaction& t) {
  const auto&              s = TX(t).View();
  std::vector<std::string> refs;
  refs.reserve(s.entities.size());
  for (const auto& [ref, _] : s.entities) {
    refs.push_back(ref);
  }
  return refs;
}

std::optional<model::FinalEntityRecord> MemoryRepository::GetFinalEntity(Transaction& t, const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.final_entities.find(entity_id);
  if (it == s.final_entities.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteEntities(Transaction& t, const std::vector<std::string>& entity_refs) {
  auto& s = TX(t).Mutable();
  for (const auto& ref : entity_refs) {
    auto it = s.entities.find(ref);
    if (it == s.entities.end()) continue;

    s.final_entities.erase(it->second.entity_id);
    s.ref_by_id.erase(it->second.entity_id);
    s.entities.erase(it);
  }
  return Result::Ok();
}

Result MemoryRepository::MarkForReprocessing(Transaction& t, const std::vector<std::string>& entity_refs, const std::string& marker_hash) {
  auto& s = TX(t).Mutable();
  for (const auto& ref : entity_refs) {
    auto it = s.entities.find(ref);
    if (it == s.entities.end()) continue;

    it->second.result_hash        = marker_hash;
    it->second.needs_reprocessing = true;

    auto fit = s.final_entities.find(it->second.entity_id);
    if (fit != s.final_entities.end()) {
      fit->second.hash = marker_hash;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Reference edges
// ------------------------------------------------------------------

Result MemoryRepository::InsertReference(Transaction& t, const model::ReferenceRecord& r) {
  if (r.source_key.has_value() == r.source_entity_ref.has_value()) {
    return Result::Err(ErrorCode::ConstraintViolation, "exactly one of source_key/source_entity_ref must be set");
  }
  if (r.target_entity_ref.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "target_entity_ref is required");
  }
  TX(t).Mutable().references.push_back(r);
  return Result::Ok();
}

std::vector<model::ReferenceRecord> MemoryRepository::ListReferences(Transaction& t) {
  return TX(t).View().references;
}

Result MemoryRepository::DeleteReferencesFromSources(Transaction& t, const std::vector<std::string>& source_refs) {
  auto&                                 s = TX(t).Mutable();
  const std::unordered_set<std::string> sources(source_refs.begin(), source_refs.end());

  std::erase_if(s.references, [&](const model::ReferenceRecord& r) {
    return r.source_entity_ref.has_value() && sources.contains(*r.source_entity_ref);
  });
  return Result::Ok();
}

Result MemoryRepository::DeleteReferencesToTargets(Transaction& t, const std::vector<std::string>& target_refs) {
  auto&                                 s = TX(t).Mutable();
  const std::unordered_set<std::string> targets(target_refs.begin(), target_refs.end());

  std::erase_if(s.references, [&](const model::ReferenceRecord& r) {
    return !r.IsRoot() && targets.contains(r.target_entity_ref);
  });
  return Result::Ok();
}

} // namespace catalog::db::memory
