#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <map>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace workgraph::db::sqlite {

using workgraph::db::ErrorCode;
using workgraph::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    return StmtPtr(st, &sqlite3_finalize);
}

// Reads have no Result channel; a statement that does not prepare is a bug or a broken schema.
StmtPtr PrepareOrThrow(sqlite3* db, const char* sql) {
    auto st = Prepare(db, sql);
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<double> ColOptionalDouble(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

// id,title,status,priority,item_type,estimated_effort_hours,created_at_ms,updated_at_ms
model::WorkItemRecord ReadItem(sqlite3_stmt* st) {
    model::WorkItemRecord r;
    r.id                     = ColText(st, 0);
    r.title                  = ColText(st, 1);
    r.status                 = ColText(st, 2);
    r.priority               = ColText(st, 3);
    r.item_type              = ColText(st, 4);
    r.estimated_effort_hours = ColOptionalDouble(st, 5);
    r.created_at_ms          = ColU64(st, 6);
    r.updated_at_ms          = ColU64(st, 7);
    return r;
}

// from_id,to_id,kind,created_at_ms
model::EdgeRecord ReadEdge(sqlite3_stmt* st) {
    model::EdgeRecord e;
    e.from_id       = ColText(st, 0);
    e.to_id         = ColText(st, 1);
    e.kind          = ColText(st, 2);
    e.created_at_ms = ColU64(st, 3);
    return e;
}

std::vector<model::EdgeRecord> ReadEdges(sqlite3_stmt* st) {
    std::vector<model::EdgeRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEdge(st));
    }
    return out;
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
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Work items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::WorkItemRecord& r) {
    auto* db = TX(t).Handle();

    if (GetItem(t, r.id) || IsRetired(t, r.id))
        return Result::Err(ErrorCode::AlreadyExists, r.id);

    auto st = Prepare(db, sql::INSERT_ITEM);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.title);
    BindText(st.get(), 3, r.status);
    BindText(st.get(), 4, r.priority);
    BindText(st.get(), 5, r.item_type);
    BindOptionalDouble(st.get(), 6, r.estimated_effort_hours);
    BindU64(st.get(), 7, r.created_at_ms);
    BindU64(st.get(), 8, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::WorkItemRecord>
SqliteRepository::GetItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_ITEM);

    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;

    return ReadItem(st.get());
}

std::vector<model::WorkItemRecord> SqliteRepository::ListItems(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_ALL_ITEMS);

    std::vector<model::WorkItemRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadItem(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::WorkItemRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPDATE_ITEM);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.title);
    BindText(st.get(), 2, r.status);
    BindText(st.get(), 3, r.priority);
    BindText(st.get(), 4, r.item_type);
    BindOptionalDouble(st.get(), 5, r.estimated_effort_hours);
    BindU64(st.get(), 6, r.created_at_ms);
    BindU64(st.get(), 7, r.updated_at_ms);
    BindText(st.get(), 8, r.id);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
}

Result SqliteRepository::DeleteItem(Transaction& t, const std::string& id, uint64_t retired_at_ms) {
    auto* db = TX(t).Handle();

    if (!GetItem(t, id)) return Result::Err(ErrorCode::NotFound, id);

    {
        auto count = Prepare(db, sql::COUNT_REFERENCES);
        if (!count) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(count.get(), 1, id);
        if (sqlite3_step(count.get()) != SQLITE_ROW) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        if (sqlite3_column_int64(count.get(), 0) > 0)
            return Result::Err(ErrorCode::ConstraintViolation, id + " is referenced by edges");
    }

    auto del = Prepare(db, sql::DELETE_ITEM);
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(del.get(), 1, id);
    auto deleted = Translate(db, sqlite3_step(del.get()));
    if (!deleted) return deleted;

    auto retire = Prepare(db, sql::INSERT_RETIRED);
    if (!retire) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(retire.get(), 1, id);
    BindU64(retire.get(), 2, retired_at_ms);
    return Translate(db, sqlite3_step(retire.get()));
}

bool SqliteRepository::IsRetired(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_RETIRED);
    BindText(st.get(), 1, id);
    return sqlite3_step(st.get()) == SQLITE_ROW;
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertEdge(Transaction& t, const model::EdgeRecord& r) {
    auto* db = TX(t).Handle();

    {
        auto existing = Prepare(db, sql::SELECT_EDGE);
        if (!existing) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(existing.get(), 1, r.from_id);
        BindText(existing.get(), 2, r.to_id);
        BindText(existing.get(), 3, r.kind);
        if (sqlite3_step(existing.get()) == SQLITE_ROW)
            return Result::Err(ErrorCode::AlreadyExists, r.from_id + " -> " + r.to_id);
    }

    auto st = Prepare(db, sql::INSERT_EDGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.from_id);
    BindText(st.get(), 2, r.to_id);
    BindText(st.get(), 3, r.kind);
    BindU64(st.get(), 4, r.created_at_ms);

    // a missing endpoint surfaces as a foreign key ConstraintViolation
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteEdge(Transaction& t, const std::string& from_id, const std::string& to_id, const std::string& kind) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_EDGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, from_id);
    BindText(st.get(), 2, to_id);
    BindText(st.get(), 3, kind);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EdgeRecord>
SqliteRepository::GetOutgoing(Transaction& t, const std::string& id) {
    auto st = PrepareOrThrow(TX(t).Handle(), sql::SELECT_OUTGOING);
    BindText(st.get(), 1, id);
    return ReadEdges(st.get());
}

std::vector<model::EdgeRecord>
SqliteRepository::GetIncoming(Transaction& t, const std::string& id) {
    auto st = PrepareOrThrow(TX(t).Handle(), sql::SELECT_INCOMING);
    BindText(st.get(), 1, id);
    return ReadEdges(st.get());
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t) {
    auto items = ListItems(t);

    auto st = PrepareOrThrow(TX(t).Handle(), sql::SELECT_ALL_EDGES);
    std::map<std::string, std::vector<model::EdgeRecord>> outgoing;
    for (auto& edge : ReadEdges(st.get())) {
        auto from = edge.from_id;
        outgoing[from].push_back(std::move(edge));
    }

    std::vector<model::DocumentRecord> documents;
    documents.reserve(items.size());
    for (auto& item : items) {
        model::DocumentRecord doc;
        auto it = outgoing.find(item.id);
        if (it != outgoing.end()) doc.outgoing = std::move(it->second);
        doc.item = std::move(item);
        documents.push_back(std::move(doc));
    }
    return documents;
}

} // namespace workgraph::db::sqlite
