#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace catalog::db::sqlite {

using catalog::db::ErrorCode;
using catalog::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value()) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

// Reads must not pass off a failure as "no rows".
Statement PrepareRead(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st, &sqlite3_finalize);
}

void ThrowIfNotDone(sqlite3* db, int rc) {
    if (rc != SQLITE_DONE) {
        throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
    model::EntityRecord r;
    r.entity_id          = ColText(st, 0);
    r.entity_ref         = ColText(st, 1);
    r.unprocessed_entity = ColText(st, 2);
    r.processed_entity   = ColText(st, 3);
    r.errors             = ColText(st, 4);
    r.next_update_at     = ColText(st, 5);
    r.last_discovery_at  = ColText(st, 6);
    r.result_hash        = ColText(st, 7);
    r.needs_reprocessing = ColBool(st, 8);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& e, const model::FinalEntityRecord& f) {
    auto* db = TX(t).Handle();

    if (f.entity_id != e.entity_id)
        return Result::Err(ErrorCode::ConstraintViolation, "final entity must share entity_id");

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_ENTITY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, e.entity_id);
    BindText(st, 2, e.entity_ref);
    BindText(st, 3, e.unprocessed_entity);
    BindText(st, 4, e.processed_entity);
    BindText(st, 5, e.errors);
    BindText(st, 6, e.next_update_at);
    BindText(st, 7, e.last_discovery_at);
    BindText(st, 8, e.result_hash);
    BindBool(st, 9, e.needs_reprocessing);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (auto r = Translate(db, rc); !r) return r;

    st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FINAL_ENTITY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, f.entity_id);
    BindText(st, 2, f.hash);
    BindText(st, 3, f.stitch_ticket);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::EntityRecord>
SqliteRepository::GetEntity(Transaction& t, const std::string& entity_ref) {
    auto* db = TX(t).Handle();
    auto  st = PrepareRead(db, sql::SELECT_ENTITY);

    BindText(st.get(), 1, entity_ref);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) return ReadEntity(st.get());
    ThrowIfNotDone(db, rc);
    return std::nullopt;
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareRead(db, sql::SELECT_ENTITIES);

    std::vector<model::EntityRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadEntity(st.get()));
    }
    ThrowIfNotDone(db, rc);
    return out;
}

std::vector<std::string> SqliteRepository::ListEntityRefs(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareRead(db, sql::SELECT_ENTITY_REFS);

    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    ThrowIfNotDone(db, rc);
    return out;
}

std::optional<model::FinalEntityRecord>
SqliteRepository::GetFinalEntity(Transaction& t, const std::string& entity_id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareRead(db, sql::SELECT_FINAL_ENTITY);

    BindText(st.get(), 1, entity_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) {
        ThrowIfNotDone(db, rc);
        return std::nullopt;
    }

    model::FinalEntityRecord r;
    r.entity_id     = ColText(st.get(), 0);
    r.hash          = ColText(st.get(), 1);
    r.stitch_ticket = ColText(st.get(), 2);
    return r;
}

Result SqliteRepository::DeleteEntities(Transaction& t, const std::vector<std::string>& entity_refs) {
    auto* db = TX(t).Handle();

    // final rows first: the lookup goes through entities.entity_ref
    for (const char* sql : {sql::DELETE_FINAL_ENTITY_BY_REF, sql::DELETE_ENTITY_BY_REF}) {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        for (const auto& ref : entity_refs) {
            BindText(st, 1, ref);
            int rc = sqlite3_step(st);
            if (auto r = Translate(db, rc); !r) {
                sqlite3_finalize(st);
                return r;
            }
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);
        }
        sqlite3_finalize(st);
    }
    return Result::Ok();
}

Result SqliteRepository::MarkForReprocessing(Transaction& t, const std::vector<std::string>& entity_refs, const std::string& marker_hash) {
    auto* db = TX(t).Handle();

    for (const char* sql : {sql::MARK_FINAL_ENTITY, sql::MARK_ENTITY}) {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        for (const auto& ref : entity_refs) {
            BindText(st, 1, marker_hash);
            BindText(st, 2, ref);
            int rc = sqlite3_step(st);
            if (auto r = Translate(db, rc); !r) {
                sqlite3_finalize(st);
                return r;
            }
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);
        }
        sqlite3_finalize(st);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Reference edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertReference(Transaction& t, const model::ReferenceRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_REFERENCE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(st, 1, r.source_key);
    BindOptText(st, 2, r.source_entity_ref);
    BindText(st, 3, r.target_entity_ref);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::ReferenceRecord> SqliteRepository::ListReferences(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareRead(db, sql::SELECT_REFERENCES);

    std::vector<model::ReferenceRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::ReferenceRecord r;
        r.source_key        = ColOptText(st.get(), 0);
        r.source_entity_ref = ColOptText(st.get(), 1);
        r.target_entity_ref = ColText(st.get(), 2);
        out.push_back(std::move(r));
    }
    ThrowIfNotDone(db, rc);
    return out;
}

Result SqliteRepository::DeleteReferencesFromSources(Transaction& t, const std::vector<std::string>& source_refs) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_REFERENCES_FROM_SOURCE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& ref : source_refs) {
        BindText(st, 1, ref);
        int rc = sqlite3_step(st);
        if (auto r = Translate(db, rc); !r) {
            sqlite3_finalize(st);
            return r;
        }
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
    sqlite3_finalize(st);
    return Result::Ok();
}

Result SqliteRepository::DeleteReferencesToTargets(Transaction& t, const std::vector<std::string>& target_refs) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_REFERENCES_TO_TARGET, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& ref : target_refs) {
        BindText(st, 1, ref);
        int rc = sqlite3_step(st);
        if (auto r = Translate(db, rc); !r) {
            sqlite3_finalize(st);
            return r;
        }
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
    sqlite3_finalize(st);
    return Result::Ok();
}

} // namespace catalog::db::sqlite
