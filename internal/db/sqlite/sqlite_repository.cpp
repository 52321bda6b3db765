#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace hostreg::db::sqlite {

using hostreg::db::ErrorCode;
using hostreg::db::Result;
using hostreg::model::LifecycleStage;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr PrepareStmt(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        st = nullptr;
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

template <typename T>
void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (v) sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
    else sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

// Column order matches sql::SELECT_SERVICE / sql::LIST_SERVICES.
model::ServiceRecord ReadRow(sqlite3_stmt* st) {
    model::ServiceRecord r;
    r.name            = ColText(st, 0);
    r.description     = ColOptText(st, 1);
    if (auto port = ColOptU64(st, 2)) r.port = static_cast<uint16_t>(*port);
    r.health_endpoint = ColOptText(st, 3);
    r.base_url        = ColOptText(st, 4);
    r.stage           = hostreg::model::ParseLifecycleStage(ColText(st, 5)).value_or(LifecycleStage::kRaw);
    r.run_state       = ColText(st, 6);
    r.last_scanned_at_ms = ColOptU64(st, 7);
    r.created_at_ms   = ColU64(st, 8);
    r.updated_at_ms   = ColU64(st, 9);
    return r;
}

std::string StageText(LifecycleStage stage) {
    return std::string(hostreg::model::ToString(stage));
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

    switch (rc) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
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
// Services
// ------------------------------------------------------------------

Result SqliteRepository::InsertService(Transaction& t, const model::ServiceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::INSERT_SERVICE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.name);
    BindOptText(st.get(), 2, r.description);
    BindOptInt(st.get(), 3, r.port);
    BindOptText(st.get(), 4, r.health_endpoint);
    BindOptText(st.get(), 5, r.base_url);
    BindText(st.get(), 6, StageText(r.stage));
    BindText(st.get(), 7, r.run_state);
    BindOptInt(st.get(), 8, r.last_scanned_at_ms);
    BindU64(st.get(), 9, r.created_at_ms);
    BindU64(st.get(), 10, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ServiceRecord>
SqliteRepository::GetService(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_SERVICE);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, name);

    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return ReadRow(st.get());
}

std::vector<model::ServiceRecord> SqliteRepository::ListServices(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::LIST_SERVICES);
    if (!st) return {};

    std::vector<model::ServiceRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadRow(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateService(Transaction& t, const model::ServiceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::UPDATE_SERVICE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(st.get(), 1, r.description);
    BindOptInt(st.get(), 2, r.port);
    BindOptText(st.get(), 3, r.health_endpoint);
    BindOptText(st.get(), 4, r.base_url);
    BindText(st.get(), 5, StageText(r.stage));
    BindText(st.get(), 6, r.run_state);
    BindOptInt(st.get(), 7, r.last_scanned_at_ms);
    BindU64(st.get(), 8, r.updated_at_ms);
    BindText(st.get(), 9, r.name);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "service '" + r.name + "' not found");
    }
    return result;
}

Result SqliteRepository::DeleteService(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::DELETE_SERVICE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, name);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "service '" + name + "' not found");
    }
    return result;
}

} // namespace hostreg::db::sqlite
