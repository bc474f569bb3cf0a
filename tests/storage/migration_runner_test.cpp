/**
 * @file migration_runner_test.cpp
 * @brief Unit tests for migration_runner class
 */

#include <catch2/catch_test_macros.hpp>

#include <sgkdoc/storage/migration_runner.hpp>

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string_view>

using namespace sgkdoc::storage;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        auto rc = sqlite3_open(":memory:", &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;
    test_database(test_database&&) = delete;
    auto operator=(test_database&&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto object_exists(const char* type, const char* name) const -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

    [[nodiscard]] auto table_exists(const char* name) const -> bool {
        return object_exists("table", name);
    }

    [[nodiscard]] auto index_exists(const char* name) const -> bool {
        return object_exists("index", name);
    }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

// ============================================================================
// Initial State
// ============================================================================

TEST_CASE("migration_runner initial state", "[migration][version]") {
    test_database db;
    migration_runner runner;

    SECTION("empty database has version 0") {
        CHECK(runner.get_current_version(db.get()) == 0);
    }

    SECTION("empty database has no history") {
        CHECK(runner.get_history(db.get()).empty());
    }
}

// ============================================================================
// Migration Execution
// ============================================================================

TEST_CASE("migration_runner run_migrations", "[migration][execute]") {
    test_database db;
    migration_runner runner;

    SECTION("initial migration reaches the latest version") {
        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_ok());
        CHECK(runner.get_current_version(db.get()) == migration_runner::LATEST_VERSION);
    }

    SECTION("migration is idempotent") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        auto history = runner.get_history(db.get());
        CHECK(history.size() == static_cast<std::size_t>(migration_runner::LATEST_VERSION));
    }

    SECTION("history records each applied version") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        auto history = runner.get_history(db.get());
        REQUIRE_FALSE(history.empty());
        CHECK(history.front().version == 1);
        CHECK_FALSE(history.front().description.empty());
        CHECK_FALSE(history.front().applied_at.empty());
    }

    SECTION("target beyond the latest version is rejected") {
        auto result = runner.run_migrations_to(db.get(), migration_runner::LATEST_VERSION + 1);
        CHECK(result.is_err());
        CHECK(runner.get_current_version(db.get()) == 0);
    }

    SECTION("target 0 only creates the version table") {
        REQUIRE(runner.run_migrations_to(db.get(), 0).is_ok());
        CHECK(db.table_exists("schema_version"));
        CHECK_FALSE(db.table_exists("documents"));
    }
}

// ============================================================================
// V1 Schema
// ============================================================================

TEST_CASE("migration_runner v1 schema", "[migration][schema]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    SECTION("tables exist") {
        CHECK(db.table_exists("documents"));
        CHECK(db.table_exists("document_workflow_history"));
        CHECK(db.table_exists("patients"));
        CHECK(db.table_exists("patient_status_history"));
    }

    SECTION("indexes exist") {
        CHECK(db.index_exists("idx_documents_patient"));
        CHECK(db.index_exists("idx_status_history_patient"));
    }

    SECTION("run id is unique") {
        const char* insert =
            "INSERT INTO documents (id, run_id, document_type, filename, created_at) "
            "VALUES (?, 'run_1', 'recete', 'a.pdf', 0);";

        for (const char* id : {"doc_a", "doc_b"}) {
            sqlite3_stmt* stmt = nullptr;
            REQUIRE(sqlite3_prepare_v2(db.get(), insert, -1, &stmt, nullptr) == SQLITE_OK);
            sqlite3_bind_text(stmt, 1, id, -1, SQLITE_TRANSIENT);
            auto rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);

            if (std::string_view(id) == "doc_a") {
                CHECK(rc == SQLITE_DONE);
            } else {
                CHECK((rc & 0xFF) == SQLITE_CONSTRAINT);
            }
        }
    }
}
