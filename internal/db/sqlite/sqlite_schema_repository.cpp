#include "sqlite_schema_repository.hpp"

#include "internal/util/errors.hpp"

namespace relaystore::db::sqlite {

using relaystore::db::ErrorCode;
using relaystore::db::Result;

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    // data() is never null, so an empty string binds a zero-length blob rather than NULL
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    int n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), n) : std::string{};
}

static std::optional<std::string> ColNullableBlob(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL)
        return std::nullopt;
    return ColBlob(st, col);
}

SqliteSchemaRepository::SqliteSchemaRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteSchemaRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

std::unique_ptr<db::Transaction> SqliteSchemaRepository::BeginSnapshot() {
    auto reader = std::make_shared<SqliteDB>(db_->Path(), db_->BusyTimeoutMs());
    return std::make_unique<SqliteTransaction>(std::move(reader), SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteSchemaRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteSchemaRepository::Translate(sqlite3* db, int rc) {
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
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteSchemaRepository::EnsureLedger() {
    char* err = nullptr;
    int rc = sqlite3_exec(db_->Handle(),
                          "CREATE TABLE IF NOT EXISTS migrations (serial_number INTEGER PRIMARY KEY);",
                          nullptr, nullptr, &err);
    sqlite3_free(err);
    return Translate(db_->Handle(), rc);
}

Result SqliteSchemaRepository::Execute(Transaction& t, const std::string& sql) {
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc == SQLITE_OK) {
        return Result::Ok();
    }

    auto result = Translate(db, rc);
    if (err) {
        result.message = err;
        sqlite3_free(err);
    }
    return result;
}

bool SqliteSchemaRepository::IsApplied(Transaction& t, int64_t serial_number) {
    auto& db = TX(t).DB();

    auto st = db.Prepare("SELECT COUNT(*) FROM migrations WHERE serial_number=?;");
    BindI64(st.get(), 1, serial_number);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW)
        throw util::DatabaseError(Translate(db.Handle(), rc).ToString());

    return sqlite3_column_int64(st.get(), 0) > 0;
}

Result SqliteSchemaRepository::RecordApplied(Transaction& t, int64_t serial_number) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO migrations VALUES(?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindI64(st.get(), 1, serial_number);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<int64_t> SqliteSchemaRepository::MaxApplied(Transaction& t) {
    auto& db = TX(t).DB();

    auto st = db.Prepare("SELECT MAX(serial_number) FROM migrations;");
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW)
        throw util::DatabaseError(Translate(db.Handle(), rc).ToString());

    if (sqlite3_column_type(st.get(), 0) == SQLITE_NULL)
        return std::nullopt;
    return sqlite3_column_int64(st.get(), 0);
}

std::vector<int64_t> SqliteSchemaRepository::ListApplied(Transaction& t) {
    auto& db = TX(t).DB();

    auto st = db.Prepare("SELECT serial_number FROM migrations ORDER BY serial_number ASC;");

    std::vector<int64_t> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(sqlite3_column_int64(st.get(), 0));
    }
    if (rc != SQLITE_DONE)
        throw util::DatabaseError(Translate(db.Handle(), rc).ToString());
    return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

uint64_t SqliteSchemaRepository::CountEvents(Transaction& t) {
    auto& db = TX(t).DB();

    auto st = db.Prepare("SELECT COUNT(*) FROM event;");
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW)
        throw util::DatabaseError(Translate(db.Handle(), rc).ToString());
    return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

// sqlite steps one row at a time, so batch_size has no effect here
Result SqliteSchemaRepository::ScanEvents(Transaction& t, std::size_t, const EventVisitor& visit) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT id, content FROM event ORDER BY id;", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::EventRecord e;
        e.id = ColBlob(st.get(), 0);
        e.content = ColBlob(st.get(), 1);

        auto visited = visit(e);
        if (!visited)
            return visited;
    }
    return Translate(db, rc);
}

Result SqliteSchemaRepository::InsertEvent(Transaction& t, const model::EventRecord& e) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO event(id,pub_key,created_at,kind,content,hidden,delegated_by) VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindBlob(st.get(), 1, e.id);
    BindBlob(st.get(), 2, e.pub_key);
    BindI64(st.get(), 3, e.created_at);
    BindI64(st.get(), 4, e.kind);
    BindBlob(st.get(), 5, e.content);
    BindI64(st.get(), 6, e.hidden ? 1 : 0);
    if (e.delegated_by.empty())
        sqlite3_bind_null(st.get(), 7);
    else
        BindBlob(st.get(), 7, e.delegated_by);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Tags
// ------------------------------------------------------------------

Result SqliteSchemaRepository::DeleteAllTags(Transaction& t) {
    return Execute(t, "DELETE FROM tag;");
}

Result SqliteSchemaRepository::InsertTag(Transaction& t, const model::TagRecord& tag) {
    auto* db = TX(t).Handle();

    const char* sql = tag.value_hex
        ? "INSERT INTO tag(event_id,name,value_hex) VALUES(?,?,?) ON CONFLICT DO NOTHING;"
        : "INSERT INTO tag(event_id,name,value) VALUES(?,?,?) ON CONFLICT DO NOTHING;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindBlob(st.get(), 1, tag.event_id);
    BindText(st.get(), 2, tag.name);
    BindBlob(st.get(), 3, tag.value_hex ? *tag.value_hex : tag.value.value_or(std::string{}));

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TagRecord> SqliteSchemaRepository::ListTags(Transaction& t, const std::string& event_id) {
    auto& db = TX(t).DB();

    auto st = db.Prepare("SELECT name, value, value_hex FROM tag WHERE event_id=? ORDER BY id ASC;");
    BindBlob(st.get(), 1, event_id);

    std::vector<model::TagRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::TagRecord tag;
        tag.event_id = event_id;
        tag.name = ColText(st.get(), 0);
        tag.value = ColNullableBlob(st.get(), 1);
        tag.value_hex = ColNullableBlob(st.get(), 2);
        out.push_back(std::move(tag));
    }
    if (rc != SQLITE_DONE)
        throw util::DatabaseError(Translate(db.Handle(), rc).ToString());
    return out;
}

} // namespace relaystore::db::sqlite
