/**
 * @file migration_runner.cpp
 * @brief Implementation of the schema migration runner
 */

#include "sgkdoc/storage/migration_runner.hpp"

#include <sqlite3.h>

#include <sgkdoc/compat/format.hpp>

namespace sgkdoc::storage {

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner() {
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version) -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return sgkdoc_void_error(
            error_codes::database_open_error,
            sgkdoc::compat::format("Target version {} exceeds latest version {}",
                                   target_version, LATEST_VERSION));
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);
    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return 0;
    }

    rc = sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1, &stmt,
                            nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // NULL reads as 0
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

auto migration_runner::get_history(sqlite3* db) const -> std::vector<migration_record> {
    std::vector<migration_record> history;

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "SELECT version, description, applied_at FROM schema_version ORDER BY version;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )");
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }

    return sgkdoc_void_error(
        error_codes::database_open_error,
        sgkdoc::compat::format("Migration for version {} not found", version));
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description) -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "INSERT INTO schema_version (version, description) VALUES (?, ?);", -1, &stmt,
        nullptr);
    if (rc != SQLITE_OK) {
        return sgkdoc_void_error(
            error_codes::database_open_error,
            sgkdoc::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(), static_cast<int>(description.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sgkdoc_void_error(
            error_codes::database_open_error,
            sgkdoc::compat::format("Failed to record migration: {}", sqlite3_errmsg(db)));
    }
    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    const std::string statement(sql);
    auto rc = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : std::string(sqlite3_errstr(rc));
        sqlite3_free(errmsg);
        return sgkdoc_void_error(
            error_codes::database_open_error,
            sgkdoc::compat::format("SQL execution failed: {}", error_str));
    }
    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE documents (
            id                        TEXT PRIMARY KEY,
            run_id                    TEXT NOT NULL UNIQUE,
            patient_id                TEXT,
            document_type             TEXT NOT NULL,
            filename                  TEXT NOT NULL,
            original_filename         TEXT,
            media_type                TEXT,
            ocr_text                  TEXT,
            ocr_confidence            REAL NOT NULL DEFAULT 0,
            classification_confidence REAL NOT NULL DEFAULT 0,
            classification_method     TEXT,
            match_confidence          REAL NOT NULL DEFAULT 0,
            match_tier                TEXT,
            match_method              TEXT,
            requires_confirmation     INTEGER NOT NULL DEFAULT 0,
            workflow_status           TEXT,
            boundary_detected         INTEGER NOT NULL DEFAULT 0,
            detection_method          TEXT,
            processing_steps          TEXT,
            manual_assignment         INTEGER NOT NULL DEFAULT 0,
            within_budget             INTEGER NOT NULL DEFAULT 0,
            placeholder               INTEGER NOT NULL DEFAULT 0,
            original_size             INTEGER NOT NULL DEFAULT 0,
            byte_size                 INTEGER NOT NULL DEFAULT 0,
            pdf                       BLOB,
            preview                   BLOB,
            created_at                INTEGER NOT NULL
        );

        CREATE INDEX idx_documents_patient ON documents(patient_id);

        CREATE TABLE document_workflow_history (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            document_id TEXT NOT NULL REFERENCES documents(id),
            status      TEXT NOT NULL,
            changed_at  INTEGER NOT NULL
        );

        CREATE TABLE patients (
            patient_id            TEXT PRIMARY KEY,
            name                  TEXT NOT NULL,
            tc_number             TEXT,
            birth_date            TEXT,
            phone                 TEXT,
            workflow_status       TEXT,
            legacy_status         TEXT,
            last_query_run_id     TEXT,
            last_query_confidence REAL,
            last_query_tier       TEXT,
            last_query_at         INTEGER
        );

        CREATE TABLE patient_status_history (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            patient_id  TEXT NOT NULL REFERENCES patients(patient_id),
            status      TEXT NOT NULL,
            label       TEXT NOT NULL,
            description TEXT,
            notes       TEXT,
            changed_at  INTEGER NOT NULL
        );

        CREATE INDEX idx_status_history_patient ON patient_status_history(patient_id);
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 1, "Documents, patients and workflow history");
}

}  // namespace sgkdoc::storage
