#pragma once

namespace auditgate::db::sql {

/*
  Canonical SQL for the invocation log.

  success is 1/0; error_detail is NULL for successes.
*/

inline constexpr int kSchemaVersion = 1;

static constexpr const char* CREATE_INVOCATION_EVENTS =
    "CREATE TABLE IF NOT EXISTS invocation_events ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " timestamp_ms INTEGER NOT NULL,"
    " operation_name TEXT NOT NULL CHECK (operation_name <> ''),"
    " session_id TEXT,"
    " client_name TEXT,"
    " client_version TEXT,"
    " request_id TEXT,"
    " arguments TEXT,"
    " success INTEGER NOT NULL CHECK (success IN (0, 1)),"
    " error_detail TEXT,"
    " duration_ms REAL NOT NULL CHECK (duration_ms >= 0),"
    " CHECK ((success = 1 AND error_detail IS NULL) OR"
    "        (success = 0 AND error_detail IS NOT NULL AND error_detail <> ''))"
    ");";

static constexpr const char* CREATE_INDEX_TIMESTAMP =
    "CREATE INDEX IF NOT EXISTS idx_invocation_events_timestamp ON invocation_events (timestamp_ms);";

static constexpr const char* CREATE_INDEX_SESSION =
    "CREATE INDEX IF NOT EXISTS idx_invocation_events_session ON invocation_events (session_id);";

static constexpr const char* CREATE_INDEX_OPERATION =
    "CREATE INDEX IF NOT EXISTS idx_invocation_events_operation ON invocation_events (operation_name);";

static constexpr const char* CREATE_INDEX_CLIENT =
    "CREATE INDEX IF NOT EXISTS idx_invocation_events_client ON invocation_events (client_name);";

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS audit_schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms INTEGER NOT NULL"
    ");";

static constexpr const char* RECORD_SCHEMA_VERSION =
    "INSERT OR IGNORE INTO audit_schema_migrations(version, applied_at_ms)"
    " VALUES(1, CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER));";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT MAX(version) FROM audit_schema_migrations;";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO invocation_events"
    "(timestamp_ms,operation_name,session_id,client_name,client_version,request_id,"
    "arguments,success,error_detail,duration_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

// Filter clauses are appended by the store; ORDER BY / LIMIT follow.
static constexpr const char* SELECT_EVENTS_PREFIX =
    "SELECT id,timestamp_ms,operation_name,session_id,client_name,client_version,"
    "request_id,arguments,success,error_detail,duration_ms"
    " FROM invocation_events";

static constexpr const char* COUNT_EVENTS =
    "SELECT COUNT(*) FROM invocation_events;";

static constexpr const char* SUMMARY_OVERALL =
    "SELECT"
    " COUNT(*),"
    " COALESCE(SUM(CASE WHEN success = 0 THEN 1 ELSE 0 END), 0),"
    " COUNT(DISTINCT operation_name),"
    " COUNT(DISTINCT client_name),"
    " COUNT(DISTINCT session_id),"
    " COALESCE(AVG(duration_ms), 0),"
    " COALESCE(MAX(duration_ms), 0),"
    " MIN(timestamp_ms),"
    " MAX(timestamp_ms)"
    " FROM invocation_events;";

static constexpr const char* SUMMARY_PER_OPERATION =
    "SELECT"
    " operation_name,"
    " COUNT(*) AS calls,"
    " SUM(CASE WHEN success = 0 THEN 1 ELSE 0 END),"
    " AVG(duration_ms),"
    " MAX(duration_ms)"
    " FROM invocation_events"
    " GROUP BY operation_name"
    " ORDER BY calls DESC, operation_name ASC;";

}
