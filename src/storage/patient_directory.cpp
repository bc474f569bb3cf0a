/**
 * @file patient_directory.cpp
 * @brief SQLite implementation of the patient directory
 */

#include "sgkdoc/storage/patient_directory.hpp"

#include <sgkdoc/compat/format.hpp>

#include <sqlite3.h>

#include <array>
#include <utility>

namespace sgkdoc::storage {

namespace {

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

auto parse_tier(std::string_view text) -> matching::match_tier {
    constexpr std::array tiers = {matching::match_tier::high, matching::match_tier::medium,
                                  matching::match_tier::low, matching::match_tier::none};
    for (auto tier : tiers) {
        if (matching::to_string(tier) == text) {
            return tier;
        }
    }
    return matching::match_tier::none;
}

auto not_found(std::string_view patient_id) -> VoidResult {
    return sgkdoc_void_error(error_codes::patient_not_found, "Hasta bulunamadı",
                             std::string(patient_id));
}

/// Runs a prepared single-step write; finalizes the statement
auto step_write(const sqlite_database& db, sqlite3_stmt* stmt, std::string_view context)
    -> VoidResult {
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return VoidResult(db.write_error(rc, context));
    }
    return ok();
}

}  // namespace

sqlite_patient_directory::sqlite_patient_directory(std::shared_ptr<sqlite_database> database)
    : db_(std::move(database)) {}

// Caller holds the database lock
auto sqlite_patient_directory::exists(std::string_view patient_id) const -> bool {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_->handle(), "SELECT 1 FROM patients WHERE patient_id = ?;", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bind_text(stmt, 1, patient_id);
    const bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

// ============================================================================
// Queries
// ============================================================================

auto sqlite_patient_directory::all() const -> Result<std::vector<patient>> {
    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "SELECT patient_id, name, tc_number, birth_date, phone FROM patients "
            "ORDER BY patient_id;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sgkdoc_error<std::vector<patient>>(
            error_codes::storage_read_failed,
            sgkdoc::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }

    std::vector<patient> patients;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        patient p;
        p.id = sqlite_database::column_text(stmt, 0);
        p.name = sqlite_database::column_text(stmt, 1);
        p.tc_number = sqlite_database::column_text(stmt, 2);
        p.birth_date = sqlite_database::column_text(stmt, 3);
        p.phone = sqlite_database::column_text(stmt, 4);
        patients.push_back(std::move(p));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sgkdoc_error<std::vector<patient>>(error_codes::storage_read_failed,
                                                  "Failed to read patients", sqlite3_errstr(rc));
    }
    return patients;
}

auto sqlite_patient_directory::find(std::string_view patient_id) const
    -> std::optional<patient_record> {
    auto guard = db_->lock();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), R"(
        SELECT patient_id, name, tc_number, birth_date, phone, workflow_status,
               legacy_status, last_query_run_id, last_query_confidence,
               last_query_tier, last_query_at
        FROM patients WHERE patient_id = ?;
    )", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::nullopt;
    }
    bind_text(stmt, 1, patient_id);

    std::optional<patient_record> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        patient_record r;
        r.info.id = sqlite_database::column_text(stmt, 0);
        r.info.name = sqlite_database::column_text(stmt, 1);
        r.info.tc_number = sqlite_database::column_text(stmt, 2);
        r.info.birth_date = sqlite_database::column_text(stmt, 3);
        r.info.phone = sqlite_database::column_text(stmt, 4);
        r.current_status = parse_workflow_status(sqlite_database::column_text(stmt, 5));
        r.legacy_status = sqlite_database::column_text(stmt, 6);
        if (r.legacy_status.empty() && r.current_status) {
            r.legacy_status = std::string(legacy_status(*r.current_status));
        }
        if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
            identity_query query;
            query.run_id = sqlite_database::column_text(stmt, 7);
            query.confidence = sqlite3_column_double(stmt, 8);
            query.tier = parse_tier(sqlite_database::column_text(stmt, 9));
            query.queried_at = sqlite_database::from_epoch_ms(sqlite3_column_int64(stmt, 10));
            r.last_identity_query = std::move(query);
        }
        record = std::move(r);
    }
    sqlite3_finalize(stmt);
    return record;
}

auto sqlite_patient_directory::status_history(std::string_view patient_id) const
    -> Result<std::vector<status_entry>> {
    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, R"(
        SELECT status, label, description, notes, changed_at
        FROM patient_status_history WHERE patient_id = ? ORDER BY id;
    )", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sgkdoc_error<std::vector<status_entry>>(
            error_codes::storage_read_failed,
            sgkdoc::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }
    bind_text(stmt, 1, patient_id);

    std::vector<status_entry> history;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto status = parse_workflow_status(sqlite_database::column_text(stmt, 0));
        if (!status) {
            continue;
        }
        status_entry entry;
        entry.status = *status;
        entry.label = sqlite_database::column_text(stmt, 1);
        entry.description = sqlite_database::column_text(stmt, 2);
        entry.notes = sqlite_database::column_text(stmt, 3);
        entry.changed_at = sqlite_database::from_epoch_ms(sqlite3_column_int64(stmt, 4));
        history.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Writes
// ============================================================================

auto sqlite_patient_directory::upsert(const patient& p) -> VoidResult {
    if (p.id.empty()) {
        return sgkdoc_void_error(error_codes::invalid_argument, "Patient id must not be empty");
    }

    auto guard = db_->lock();
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), R"(
        INSERT INTO patients (patient_id, name, tc_number, birth_date, phone)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(patient_id) DO UPDATE SET
            name = excluded.name,
            tc_number = excluded.tc_number,
            birth_date = excluded.birth_date,
            phone = excluded.phone;
    )", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return VoidResult(db_->write_error(rc, "Failed to prepare patient upsert"));
    }

    bind_text(stmt, 1, p.id);
    bind_text(stmt, 2, p.name);
    bind_text(stmt, 3, p.tc_number);
    bind_text(stmt, 4, p.birth_date);
    bind_text(stmt, 5, p.phone);
    return step_write(*db_, stmt, "Failed to upsert patient");
}

auto sqlite_patient_directory::set_workflow_status(std::string_view patient_id,
                                                   workflow_status status,
                                                   std::string_view notes) -> VoidResult {
    auto guard = db_->lock();
    auto* db = db_->handle();

    if (!exists(patient_id)) {
        return not_found(patient_id);
    }

    auto begin = db_->execute("BEGIN IMMEDIATE;");
    if (begin.is_err()) {
        return begin;
    }

    sqlite3_stmt* history = nullptr;
    auto rc = sqlite3_prepare_v2(db, R"(
        INSERT INTO patient_status_history
            (patient_id, status, label, description, notes, changed_at)
        VALUES (?, ?, ?, ?, ?, ?);
    )", -1, &history, nullptr);
    if (rc != SQLITE_OK) {
        (void)db_->execute("ROLLBACK;");
        return VoidResult(db_->write_error(rc, "Failed to prepare status history insert"));
    }
    bind_text(history, 1, patient_id);
    bind_text(history, 2, to_string(status));
    bind_text(history, 3, workflow_label(status));
    bind_text(history, 4, workflow_description(status));
    bind_text(history, 5, notes);
    sqlite3_bind_int64(history, 6,
                       sqlite_database::to_epoch_ms(std::chrono::system_clock::now()));
    auto appended = step_write(*db_, history, "Failed to append status history");
    if (appended.is_err()) {
        (void)db_->execute("ROLLBACK;");
        return appended;
    }

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(
        db, "UPDATE patients SET workflow_status = ?, legacy_status = ? WHERE patient_id = ?;",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        (void)db_->execute("ROLLBACK;");
        return VoidResult(db_->write_error(rc, "Failed to prepare status update"));
    }
    bind_text(stmt, 1, to_string(status));
    bind_text(stmt, 2, legacy_status(status));
    bind_text(stmt, 3, patient_id);
    auto updated = step_write(*db_, stmt, "Failed to update workflow status");
    if (updated.is_err()) {
        (void)db_->execute("ROLLBACK;");
        return updated;
    }

    auto commit = db_->execute("COMMIT;");
    if (commit.is_err()) {
        (void)db_->execute("ROLLBACK;");
    }
    return commit;
}

auto sqlite_patient_directory::set_last_identity_query(std::string_view patient_id,
                                                       const identity_query& query)
    -> VoidResult {
    auto guard = db_->lock();
    if (!exists(patient_id)) {
        return not_found(patient_id);
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), R"(
        UPDATE patients SET last_query_run_id = ?, last_query_confidence = ?,
                            last_query_tier = ?, last_query_at = ?
        WHERE patient_id = ?;
    )", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return VoidResult(db_->write_error(rc, "Failed to prepare identity query update"));
    }
    bind_text(stmt, 1, query.run_id);
    sqlite3_bind_double(stmt, 2, query.confidence);
    bind_text(stmt, 3, matching::to_string(query.tier));
    sqlite3_bind_int64(stmt, 4, sqlite_database::to_epoch_ms(query.queried_at));
    bind_text(stmt, 5, patient_id);
    return step_write(*db_, stmt, "Failed to store identity query");
}

auto sqlite_patient_directory::clear_last_identity_query(std::string_view patient_id)
    -> VoidResult {
    auto guard = db_->lock();
    if (!exists(patient_id)) {
        return not_found(patient_id);
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), R"(
        UPDATE patients SET last_query_run_id = NULL, last_query_confidence = NULL,
                            last_query_tier = NULL, last_query_at = NULL
        WHERE patient_id = ?;
    )", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return VoidResult(db_->write_error(rc, "Failed to prepare identity query reset"));
    }
    bind_text(stmt, 1, patient_id);
    return step_write(*db_, stmt, "Failed to clear identity query");
}

}  // namespace sgkdoc::storage
