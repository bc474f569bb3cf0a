/**
 * @file migration_runner.hpp
 * @brief Versioned schema migrations for the sgkdoc SQLite database
 *
 * Applied versions are recorded in a schema_version table; each migration
 * runs in its own transaction.
 */

#ifndef SGKDOC_STORAGE_MIGRATION_RUNNER_HPP
#define SGKDOC_STORAGE_MIGRATION_RUNNER_HPP

#include <sgkdoc/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;

namespace sgkdoc::storage {

/**
 * @brief Row of schema_version
 */
struct migration_record {
    int version;              ///< Schema version number
    std::string description;  ///< Description of the migration
    std::string applied_at;   ///< Timestamp when migration was applied
};

using migration_function = std::function<VoidResult(sqlite3* db)>;

class migration_runner {
public:
    static constexpr int LATEST_VERSION = 1;

    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    /**
     * @brief Run all pending migrations
     *
     * @note A failing migration is rolled back; earlier ones stay applied.
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version) -> VoidResult;

    /// 0 when nothing has been applied
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_history(sqlite3* db) const -> std::vector<migration_record>;

private:
    auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    auto apply_migration(sqlite3* db, int version) -> VoidResult;
    auto record_migration(sqlite3* db, int version, std::string_view description)
        -> VoidResult;

    static auto execute_sql(sqlite3* db, std::string_view sql) -> VoidResult;

    /// documents, document_workflow_history, patients, patient_status_history
    auto migrate_v1(sqlite3* db) -> VoidResult;

    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_MIGRATION_RUNNER_HPP
