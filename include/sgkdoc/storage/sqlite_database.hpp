/**
 * @file sqlite_database.hpp
 * @brief Shared SQLite connection for the document and patient stores
 */

#ifndef SGKDOC_STORAGE_SQLITE_DATABASE_HPP
#define SGKDOC_STORAGE_SQLITE_DATABASE_HPP

#include "sgkdoc/storage/migration_runner.hpp"
#include <sgkdoc/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace sgkdoc::storage {

struct database_config {
    /// Upper bound of the database file; 0 disables the quota
    std::size_t quota_bytes = 0;

    /// WAL journal (ignored for ":memory:")
    bool wal_mode = true;

    int busy_timeout_ms = 5000;
};

/**
 * @class sqlite_database
 * @brief Owns one SQLite connection and the lock serializing its use
 *
 * The quota is applied with PRAGMA max_page_count, so a write that would
 * grow the file past it fails with SQLITE_FULL.
 *
 * Thread Safety: callers hold lock() around every statement sequence.
 */
class sqlite_database {
public:
    [[nodiscard]] static auto open(std::string_view path, const database_config& config = {})
        -> Result<std::shared_ptr<sqlite_database>>;

    ~sqlite_database();

    sqlite_database(const sqlite_database&) = delete;
    auto operator=(const sqlite_database&) -> sqlite_database& = delete;
    sqlite_database(sqlite_database&&) = delete;
    auto operator=(sqlite_database&&) -> sqlite_database& = delete;

    [[nodiscard]] auto handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto lock() const -> std::unique_lock<std::mutex> {
        return std::unique_lock<std::mutex>(mutex_);
    }

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

    /// Current page limit in bytes (page_size * max_page_count)
    [[nodiscard]] auto quota_bytes() const -> std::size_t;

    /**
     * @brief Changes the quota; never below the current file size
     */
    [[nodiscard]] auto set_quota(std::size_t bytes) -> VoidResult;

    /// Executes statements without results (caller holds the lock)
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief Maps a failed write to a store error
     *
     * SQLITE_FULL becomes storage_quota_exceeded with the user-facing
     * message; everything else storage_write_failed.
     */
    [[nodiscard]] auto write_error(int rc, std::string_view context) const -> error_info;

    /// Milliseconds since the Unix epoch, as stored in INTEGER columns
    [[nodiscard]] static auto to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t;
    [[nodiscard]] static auto from_epoch_ms(int64_t ms) -> std::chrono::system_clock::time_point;

    /// Text column, empty for NULL
    [[nodiscard]] static auto column_text(sqlite3_stmt* stmt, int col) -> std::string;

    [[nodiscard]] static auto column_blob(sqlite3_stmt* stmt, int col) -> std::vector<uint8_t>;

private:
    sqlite_database(sqlite3* db, std::string path);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
    migration_runner migration_runner_;
};

/// User-facing text of storage_quota_exceeded
inline constexpr std::string_view quota_exceeded_message =
    "Depolama alanı dolu. Lütfen eski belgeleri silin.";

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_SQLITE_DATABASE_HPP
