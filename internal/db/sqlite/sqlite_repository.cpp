#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>

#include "internal/util/time.hpp"

namespace warden::db::sqlite {

using warden::db::ErrorCode;
using warden::db::Result;
using warden::model::UpdateState;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw DbError(ErrorCode::InternalError, std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

constexpr const char* kEventColumns  = "id,kind,payload,update_id,created_at";
constexpr const char* kUpdateColumns = "id,name,version,state,meta,created_at";

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id            = ColI64(st, 0);
    r.kind          = ColText(st, 1);
    r.payload       = ColOptText(st, 2);
    r.update_id     = ColOptI64(st, 3);
    r.created_at_ms = static_cast<uint64_t>(ColI64(st, 4));
    return r;
}

model::UpdateRecord ReadUpdate(sqlite3_stmt* st) {
    model::UpdateRecord r;
    r.id      = ColI64(st, 0);
    r.name    = ColText(st, 1);
    r.version = ColOptText(st, 2);

    const auto state_text = ColText(st, 3);
    const auto state      = warden::model::ParseUpdateState(state_text);
    if (!state) {
        throw DbError(ErrorCode::Corruption, "update " + std::to_string(r.id) + " has unknown state '" + state_text + "'");
    }
    r.state         = *state;
    r.meta          = ColOptText(st, 4);
    r.created_at_ms = static_cast<uint64_t>(ColI64(st, 5));
    return r;
}

template <typename Row, typename Reader>
std::vector<Row> Collect(sqlite3* db, sqlite3_stmt* st, Reader reader) {
    std::vector<Row> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(reader(st));
    }
    if (rc != SQLITE_DONE) {
        throw DbError(ErrorCode::InternalError, std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return out;
}

std::string Sql(const char* prefix, const char* columns, const char* suffix) {
    return std::string(prefix) + columns + suffix;
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
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    // created_at must not go backwards relative to id order
    uint64_t created_at = warden::util::NowMillis();
    {
        auto st = Prepare(db, "SELECT COALESCE(MAX(created_at), 0) FROM events;");
        int  rc = sqlite3_step(st.get());
        if (rc != SQLITE_ROW) return Translate(db, rc);
        created_at = std::max(created_at, static_cast<uint64_t>(ColI64(st.get(), 0)));
    }

    auto st = Prepare(db, "INSERT INTO events(kind,payload,update_id,created_at) VALUES(?,?,?,?);");
    BindText(st.get(), 1, r.kind);
    BindOptText(st.get(), 2, r.payload);
    if (r.update_id) {
        BindI64(st.get(), 3, *r.update_id);
    } else {
        sqlite3_bind_null(st.get(), 3);
    }
    BindI64(st.get(), 4, static_cast<int64_t>(created_at));

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id            = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    r.created_at_ms = created_at;
    return Result::Ok();
}

std::vector<model::EventRecord>
SqliteRepository::ListEvents(Transaction& t, int64_t after_id, std::size_t limit) {
    auto* db = TX(t).Handle();

    const auto sql = Sql("SELECT ", kEventColumns, " FROM events WHERE id > ? ORDER BY id LIMIT ?;");
    auto st = Prepare(db, sql.c_str());
    BindI64(st.get(), 1, after_id);
    BindI64(st.get(), 2, static_cast<int64_t>(limit));

    return Collect<model::EventRecord>(db, st.get(), ReadEvent);
}

std::vector<model::EventRecord>
SqliteRepository::ListEventsForUpdate(Transaction& t, int64_t update_id) {
    auto* db = TX(t).Handle();

    const auto sql = Sql("SELECT ", kEventColumns, " FROM events WHERE update_id = ? ORDER BY id;");
    auto st = Prepare(db, sql.c_str());
    BindI64(st.get(), 1, update_id);

    return Collect<model::EventRecord>(db, st.get(), ReadEvent);
}

// ------------------------------------------------------------------
// Updates
// ------------------------------------------------------------------

Result SqliteRepository::InsertUpdate(Transaction& t, model::UpdateRecord& r) {
    auto* db = TX(t).Handle();

    const auto created_at = warden::util::NowMillis();

    // updates_one_pending turns a duplicate pending row into a constraint error
    auto st = Prepare(db, "INSERT INTO updates(name,version,state,meta,created_at) VALUES(?,?,'pending',?,?);");
    BindText(st.get(), 1, r.name);
    BindOptText(st.get(), 2, r.version);
    BindOptText(st.get(), 3, r.meta);
    BindI64(st.get(), 4, static_cast<int64_t>(created_at));

    int rc = sqlite3_step(st.get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        return Result::Err(ErrorCode::AlreadyExists, "pending update exists for " + r.name);
    }
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id            = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    r.state         = UpdateState::kPending;
    r.created_at_ms = created_at;
    return Result::Ok();
}

std::optional<model::UpdateRecord>
SqliteRepository::GetUpdate(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const auto sql = Sql("SELECT ", kUpdateColumns, " FROM updates WHERE id = ?;");
    auto st = Prepare(db, sql.c_str());
    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw DbError(ErrorCode::InternalError, std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return ReadUpdate(st.get());
}

Result SqliteRepository::SetUpdateState(Transaction& t, int64_t id, UpdateState expected, UpdateState next,
                                        const std::optional<std::string>& meta) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE updates SET state = ?, meta = ? WHERE id = ? AND state = ?;");
    BindText(st.get(), 1, std::string(warden::model::ToString(next)));
    BindOptText(st.get(), 2, meta);
    BindI64(st.get(), 3, id);
    BindText(st.get(), 4, std::string(warden::model::ToString(expected)));

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 1) return Result::Ok();

    // nothing matched: either the row is gone or its state moved
    auto current = GetUpdate(t, id);
    if (!current) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "update state is " + std::string(warden::model::ToString(current->state)));
}

std::vector<model::UpdateRecord>
SqliteRepository::ListUpdatesByState(Transaction& t, UpdateState state) {
    auto* db = TX(t).Handle();

    const auto sql = Sql("SELECT ", kUpdateColumns, " FROM updates WHERE state = ? ORDER BY id;");
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, std::string(warden::model::ToString(state)));

    return Collect<model::UpdateRecord>(db, st.get(), ReadUpdate);
}

std::vector<model::UpdateRecord> SqliteRepository::ListUpdates(Transaction& t) {
    auto* db = TX(t).Handle();

    const auto sql = Sql("SELECT ", kUpdateColumns, " FROM updates ORDER BY id;");
    auto st = Prepare(db, sql.c_str());

    return Collect<model::UpdateRecord>(db, st.get(), ReadUpdate);
}

std::vector<model::UpdateRecord>
SqliteRepository::FindUpdates(Transaction& t, const std::string& name, const std::optional<std::string>& version) {
    auto* db = TX(t).Handle();

    // same identity rule as the updates_one_pending index
    const auto sql =
        Sql("SELECT ", kUpdateColumns, " FROM updates WHERE name = ? AND COALESCE(version, '') = COALESCE(?, '') ORDER BY id;");
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, name);
    BindOptText(st.get(), 2, version);

    return Collect<model::UpdateRecord>(db, st.get(), ReadUpdate);
}

} // namespace warden::db::sqlite
