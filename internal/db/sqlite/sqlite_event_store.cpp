#include "sqlite_event_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace auditgate::db::sqlite {

using auditgate::db::ErrorCode;
using auditgate::db::Result;

namespace {

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* t = sqlite3_column_text(st, col);
    return std::string(t ? reinterpret_cast<const char*>(t) : "");
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

model::InvocationEvent ReadEvent(sqlite3_stmt* st) {
    model::InvocationEvent e;
    e.id = ColU64(st, 0);
    e.timestamp_ms = ColI64(st, 1);
    e.operation_name = ColText(st, 2);
    e.session_id = ColOptionalText(st, 3);
    e.client_name = ColOptionalText(st, 4);
    e.client_version = ColOptionalText(st, 5);
    e.request_id = ColOptionalText(st, 6);
    e.arguments = ColOptionalText(st, 7);
    e.status = sqlite3_column_int(st, 8) == 1 ? model::InvocationStatus::kSuccess : model::InvocationStatus::kError;
    e.error_detail = ColOptionalText(st, 9);
    e.duration_ms = ColDouble(st, 10);
    return e;
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
    explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

    void ExecuteSQL(const std::string& sql) override {
        db_.Exec(sql);
    }

private:
    SqliteDB& db_;
};

} // namespace

SqliteEventStore::SqliteEventStore(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteReaderPool> readers)
    : writer_(std::move(writer)), readers_(std::move(readers)) {}

Result SqliteEventStore::Translate(int rc, const std::string& message) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, message);
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, message);
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, message);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, message);
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::ReadOnly, message);
        case SQLITE_FULL:
            return Result::Err(ErrorCode::Full, message);
        default:
            return Result::Err(ErrorCode::InternalError, message);
    }
}

// ------------------------------------------------------------------
// Write path
// ------------------------------------------------------------------

Result SqliteEventStore::Append(model::InvocationEvent& event) {
    if (auto valid = ValidateForAppend(event); !valid) return valid;

    std::lock_guard lock(write_mutex_);
    try {
        SqliteTransaction tx(writer_);
        auto* db = tx.Handle();

        Statement st(db, sql::INSERT_EVENT);
        st.BindInt64(1, event.timestamp_ms);
        st.BindText(2, event.operation_name);
        st.BindOptionalText(3, event.session_id);
        st.BindOptionalText(4, event.client_name);
        st.BindOptionalText(5, event.client_version);
        st.BindOptionalText(6, event.request_id);
        st.BindOptionalText(7, event.arguments);
        st.BindInt64(8, event.status == model::InvocationStatus::kSuccess ? 1 : 0);
        st.BindOptionalText(9, event.error_detail);
        st.BindDouble(10, event.duration_ms);

        const int rc = st.Step();
        if (rc != SQLITE_DONE) {
            return Translate(rc, sqlite3_errmsg(db));
        }

        const auto id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
        tx.Commit();
        event.id = id;
        return Result::Ok();
    } catch (const SqliteError& e) {
        return Translate(e.Code(), e.what());
    }
}

// ------------------------------------------------------------------
// Read path
// ------------------------------------------------------------------

std::vector<model::InvocationEvent> SqliteEventStore::Scan(const EventFilter& filter, std::optional<std::size_t> limit) {
    std::string sql = sql::SELECT_EVENTS_PREFIX;
    std::string where;
    auto add_clause = [&where](const char* clause) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    };

    if (filter.operation_name) add_clause("operation_name = ?");
    if (filter.session_id) add_clause("session_id = ?");
    if (filter.client_name) add_clause("client_name = ?");
    if (filter.since_ms) add_clause("timestamp_ms >= ?");
    if (filter.until_ms) add_clause("timestamp_ms <= ?");
    if (filter.errors_only) add_clause("success = 0");

    sql += where;
    sql += " ORDER BY id DESC LIMIT ?;";

    const auto capped = std::min(limit.value_or(kMaxScanLimit), kMaxScanLimit);

    std::shared_ptr<SqliteDB> conn;
    try {
        conn = readers_->Acquire();
    } catch (const SqliteError& e) {
        throw util::StorageError(std::string("open reader: ") + e.what());
    }

    std::vector<model::InvocationEvent> out;
    try {
        Statement st(conn->Handle(), sql.c_str());

        int bind_idx = 1;
        if (filter.operation_name) st.BindText(bind_idx++, *filter.operation_name);
        if (filter.session_id) st.BindText(bind_idx++, *filter.session_id);
        if (filter.client_name) st.BindText(bind_idx++, *filter.client_name);
        if (filter.since_ms) st.BindInt64(bind_idx++, *filter.since_ms);
        if (filter.until_ms) st.BindInt64(bind_idx++, *filter.until_ms);
        st.BindInt64(bind_idx++, static_cast<int64_t>(capped));

        int rc = SQLITE_ROW;
        while ((rc = st.Step()) == SQLITE_ROW) {
            out.push_back(ReadEvent(st.get()));
        }
        if (rc != SQLITE_DONE) ThrowRead(conn->Handle(), "scan");
    } catch (const SqliteError& e) {
        throw util::StorageError(std::string("scan: ") + e.what());
    }
    return out;
}

model::AuditSummary SqliteEventStore::Aggregate() {
    std::shared_ptr<SqliteDB> conn;
    try {
        conn = readers_->Acquire();
    } catch (const SqliteError& e) {
        throw util::StorageError(std::string("open reader: ") + e.what());
    }

    model::AuditSummary summary;
    try {
        // both statements read the same snapshot
        SqliteTransaction tx(conn, SqliteTransaction::Mode::kDeferred);
        auto* db = tx.Handle();

        {
            Statement st(db, sql::SUMMARY_OVERALL);
            if (st.Step() != SQLITE_ROW) ThrowRead(db, "aggregate");
            auto* row = st.get();
            summary.total_events = ColU64(row, 0);
            summary.error_count = ColU64(row, 1);
            summary.unique_operations = ColU64(row, 2);
            summary.unique_clients = ColU64(row, 3);
            summary.unique_sessions = ColU64(row, 4);
            summary.avg_duration_ms = ColDouble(row, 5);
            summary.max_duration_ms = ColDouble(row, 6);
            summary.first_event_ms = ColOptionalI64(row, 7);
            summary.last_event_ms = ColOptionalI64(row, 8);
        }

        {
            Statement st(db, sql::SUMMARY_PER_OPERATION);
            int rc = SQLITE_ROW;
            while ((rc = st.Step()) == SQLITE_ROW) {
                auto* row = st.get();
                model::OperationSummary op;
                op.operation_name = ColText(row, 0);
                op.count = ColU64(row, 1);
                op.error_count = ColU64(row, 2);
                op.error_rate = op.count == 0 ? 0.0 : static_cast<double>(op.error_count) / static_cast<double>(op.count);
                op.avg_duration_ms = ColDouble(row, 3);
                op.max_duration_ms = ColDouble(row, 4);
                summary.per_operation.push_back(std::move(op));
            }
            if (rc != SQLITE_DONE) ThrowRead(db, "aggregate per operation");
        }

        tx.Commit();
    } catch (const SqliteError& e) {
        throw util::StorageError(std::string("aggregate: ") + e.what());
    }

    summary.error_rate = summary.total_events == 0
                             ? 0.0
                             : static_cast<double>(summary.error_count) / static_cast<double>(summary.total_events);
    return summary;
}

uint64_t SqliteEventStore::Count() {
    std::shared_ptr<SqliteDB> conn;
    try {
        conn = readers_->Acquire();
        Statement st(conn->Handle(), sql::COUNT_EVENTS);
        if (st.Step() != SQLITE_ROW) ThrowRead(conn->Handle(), "count");
        return ColU64(st.get(), 0);
    } catch (const SqliteError& e) {
        throw util::StorageError(std::string("count: ") + e.what());
    }
}

// ------------------------------------------------------------------
// Bootstrap
// ------------------------------------------------------------------

void BootstrapSqliteSchema(SqliteDB& db) {
    static const std::vector<std::string> kBootstrapSql = {
        sql::CREATE_INVOCATION_EVENTS,
        sql::CREATE_INDEX_TIMESTAMP,
        sql::CREATE_INDEX_SESSION,
        sql::CREATE_INDEX_OPERATION,
        sql::CREATE_INDEX_CLIENT,
        sql::CREATE_SCHEMA_MIGRATIONS,
        sql::RECORD_SCHEMA_VERSION};

    SqliteMigrationExecutor executor(db);
    sql::RunMigrations(executor, kBootstrapSql);

    Statement st(db.Handle(), sql::SELECT_SCHEMA_VERSION);
    if (st.Step() != SQLITE_ROW) {
        throw SqliteError(SQLITE_ERROR, "schema version unreadable");
    }
    const auto version = ColI64(st.get(), 0);
    if (version != sql::kSchemaVersion) {
        throw SqliteError(SQLITE_ERROR, "unsupported audit schema version " + std::to_string(version));
    }
}

std::shared_ptr<SqliteEventStore> OpenSqliteEventStore(const SqliteStoreOptions& options) {
    OpenOptions open;
    open.synchronous = options.synchronous;
    open.busy_timeout_ms = options.busy_timeout_ms;

    auto writer = std::make_shared<SqliteDB>(options.path, open);
    BootstrapSqliteSchema(*writer);

    auto readers = std::make_shared<SqliteReaderPool>(options.path, options.busy_timeout_ms, options.reader_pool_size);
    // fail now rather than on the first read if the file cannot be read back
    readers->Acquire();

    return std::make_shared<SqliteEventStore>(std::move(writer), std::move(readers));
}

} // namespace auditgate::db::sqlite
