/**
 * @file sqlite_database.cpp
 * @brief Implementation of the shared SQLite connection
 */

#include "sgkdoc/storage/sqlite_database.hpp"

#include <sqlite3.h>

#include <sgkdoc/compat/format.hpp>

#include <utility>
#include <vector>

namespace sgkdoc::storage {

namespace {

auto query_int64(sqlite3* db, const char* sql) -> int64_t {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int64_t value = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto sqlite_database::open(std::string_view path, const database_config& config)
    -> Result<std::shared_ptr<sqlite_database>> {
    using result_type = std::shared_ptr<sqlite_database>;
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return sgkdoc_error<result_type>(
            error_codes::database_open_error,
            sgkdoc::compat::format("Failed to open database: {}", error_msg));
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return sgkdoc_error<result_type>(error_codes::database_open_error,
                                         "Failed to enable foreign keys");
    }

    if (config.wal_mode && path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return sgkdoc_error<result_type>(error_codes::database_open_error,
                                             "Failed to enable WAL mode");
        }
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::shared_ptr<sqlite_database>(
        new sqlite_database(db, std::string(path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return sgkdoc_error<result_type>(
            error_codes::database_open_error,
            sgkdoc::compat::format("Migration failed: {}", migration_result.error().message));
    }

    if (config.quota_bytes > 0) {
        auto quota_result = instance->set_quota(config.quota_bytes);
        if (quota_result.is_err()) {
            return quota_result.error();
        }
    }

    return instance;
}

sqlite_database::sqlite_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

sqlite_database::~sqlite_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Quota
// ============================================================================

auto sqlite_database::quota_bytes() const -> std::size_t {
    const auto page_size = query_int64(db_, "PRAGMA page_size;");
    const auto max_pages = query_int64(db_, "PRAGMA max_page_count;");
    return static_cast<std::size_t>(page_size * max_pages);
}

auto sqlite_database::set_quota(std::size_t bytes) -> VoidResult {
    const auto page_size = query_int64(db_, "PRAGMA page_size;");
    if (page_size <= 0) {
        return sgkdoc_void_error(error_codes::database_open_error,
                                 "Failed to read page size");
    }

    // SQLite silently keeps the current page count when asked for less
    const auto pages = (static_cast<int64_t>(bytes) + page_size - 1) / page_size;
    return execute(sgkdoc::compat::format("PRAGMA max_page_count = {};", pages));
}

// ============================================================================
// Statements
// ============================================================================

auto sqlite_database::execute(std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    const std::string statement(sql);
    auto rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto message = errmsg ? std::string(errmsg) : std::string(sqlite3_errstr(rc));
        sqlite3_free(errmsg);
        auto info = write_error(rc, message);
        return VoidResult(info);
    }
    return ok();
}

auto sqlite_database::schema_version() const -> int {
    return migration_runner_.get_current_version(db_);
}

auto sqlite_database::write_error(int rc, std::string_view context) const -> error_info {
    if ((rc & 0xFF) == SQLITE_FULL) {
        return error_info{error_codes::storage_quota_exceeded,
                          std::string(quota_exceeded_message), "sgkdoc",
                          std::string(context)};
    }
    return error_info{error_codes::storage_write_failed,
                      sgkdoc::compat::format("Belge kaydedilemedi: {}", sqlite3_errstr(rc)),
                      "sgkdoc", std::string(context)};
}

// ============================================================================
// Column helpers
// ============================================================================

auto sqlite_database::to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
        .count();
}

auto sqlite_database::from_epoch_ms(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto sqlite_database::column_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto sqlite_database::column_blob(sqlite3_stmt* stmt, int col) -> std::vector<uint8_t> {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
    const auto size = sqlite3_column_bytes(stmt, col);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<uint8_t>(data, data + size);
}

}  // namespace sgkdoc::storage
