/**
 * @file document_store.cpp
 * @brief SQLite implementation of the artifact store
 */

#include "sgkdoc/storage/document_store.hpp"

#include <sgkdoc/compat/format.hpp>

#include <sqlite3.h>

#include <sstream>

namespace sgkdoc::storage {

namespace {

constexpr const char* select_columns = R"(
    SELECT id, run_id, patient_id, document_type, filename, original_filename,
           media_type, ocr_text, ocr_confidence, classification_confidence,
           classification_method, match_confidence, match_tier, match_method,
           requires_confirmation, workflow_status, boundary_detected,
           detection_method, processing_steps, manual_assignment, within_budget,
           placeholder, original_size, pdf, preview, created_at
    FROM documents
)";

auto join_steps(const std::vector<std::string>& steps) -> std::string {
    std::string joined;
    for (const auto& step : steps) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += step;
    }
    return joined;
}

auto split_steps(const std::string& joined) -> std::vector<std::string> {
    std::vector<std::string> steps;
    std::istringstream stream(joined);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            steps.push_back(line);
        }
    }
    return steps;
}

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index,
                        const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_blob(sqlite3_stmt* stmt, int index, const std::vector<uint8_t>& data) {
    if (data.empty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()),
                          SQLITE_TRANSIENT);
    }
}

auto parse_row(sqlite3_stmt* stmt) -> document_artifact {
    document_artifact artifact;
    artifact.id = sqlite_database::column_text(stmt, 0);
    artifact.run_id = sqlite_database::column_text(stmt, 1);
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        artifact.patient_id = sqlite_database::column_text(stmt, 2);
    }
    artifact.type = classification::parse_document_type(sqlite_database::column_text(stmt, 3))
                        .value_or(classification::document_type::other);
    artifact.filename = sqlite_database::column_text(stmt, 4);
    artifact.original_filename = sqlite_database::column_text(stmt, 5);
    artifact.media_type = sqlite_database::column_text(stmt, 6);
    artifact.ocr_text = sqlite_database::column_text(stmt, 7);
    artifact.ocr_confidence = sqlite3_column_double(stmt, 8);
    artifact.classification_confidence = sqlite3_column_double(stmt, 9);
    artifact.classification_method = sqlite_database::column_text(stmt, 10);
    artifact.match_confidence = sqlite3_column_double(stmt, 11);
    artifact.match_tier = sqlite_database::column_text(stmt, 12);
    artifact.match_method = sqlite_database::column_text(stmt, 13);
    artifact.requires_confirmation = sqlite3_column_int(stmt, 14) != 0;
    artifact.status = parse_workflow_status(sqlite_database::column_text(stmt, 15));
    artifact.boundary_detected = sqlite3_column_int(stmt, 16) != 0;
    artifact.detection_method = sqlite_database::column_text(stmt, 17);
    artifact.processing_steps = split_steps(sqlite_database::column_text(stmt, 18));
    artifact.manual_assignment = sqlite3_column_int(stmt, 19) != 0;
    artifact.within_budget = sqlite3_column_int(stmt, 20) != 0;
    artifact.placeholder = sqlite3_column_int(stmt, 21) != 0;
    artifact.original_size = static_cast<std::size_t>(sqlite3_column_int64(stmt, 22));
    artifact.pdf = sqlite_database::column_blob(stmt, 23);
    artifact.preview = sqlite_database::column_blob(stmt, 24);
    artifact.created_at = sqlite_database::from_epoch_ms(sqlite3_column_int64(stmt, 25));
    return artifact;
}

auto prepare_error(sqlite3* db) -> std::string {
    return sgkdoc::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db));
}

}  // namespace

sqlite_document_store::sqlite_document_store(std::shared_ptr<sqlite_database> database)
    : db_(std::move(database)) {}

// ============================================================================
// Append
// ============================================================================

auto sqlite_document_store::append(const document_artifact& artifact) -> VoidResult {
    const char* sql = R"(
        INSERT INTO documents (
            id, run_id, patient_id, document_type, filename, original_filename,
            media_type, ocr_text, ocr_confidence, classification_confidence,
            classification_method, match_confidence, match_tier, match_method,
            requires_confirmation, workflow_status, boundary_detected,
            detection_method, processing_steps, manual_assignment, within_budget,
            placeholder, original_size, byte_size, pdf, preview, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return VoidResult(db_->write_error(rc, prepare_error(db)));
    }

    bind_text(stmt, 1, artifact.id);
    bind_text(stmt, 2, artifact.run_id);
    bind_optional_text(stmt, 3, artifact.patient_id);
    bind_text(stmt, 4, classification::to_tag(artifact.type));
    bind_text(stmt, 5, artifact.filename);
    bind_text(stmt, 6, artifact.original_filename);
    bind_text(stmt, 7, artifact.media_type);
    bind_text(stmt, 8, artifact.ocr_text);
    sqlite3_bind_double(stmt, 9, artifact.ocr_confidence);
    sqlite3_bind_double(stmt, 10, artifact.classification_confidence);
    bind_text(stmt, 11, artifact.classification_method);
    sqlite3_bind_double(stmt, 12, artifact.match_confidence);
    bind_text(stmt, 13, artifact.match_tier);
    bind_text(stmt, 14, artifact.match_method);
    sqlite3_bind_int(stmt, 15, artifact.requires_confirmation ? 1 : 0);
    if (artifact.status) {
        bind_text(stmt, 16, to_string(*artifact.status));
    } else {
        sqlite3_bind_null(stmt, 16);
    }
    sqlite3_bind_int(stmt, 17, artifact.boundary_detected ? 1 : 0);
    bind_text(stmt, 18, artifact.detection_method);
    bind_text(stmt, 19, join_steps(artifact.processing_steps));
    sqlite3_bind_int(stmt, 20, artifact.manual_assignment ? 1 : 0);
    sqlite3_bind_int(stmt, 21, artifact.within_budget ? 1 : 0);
    sqlite3_bind_int(stmt, 22, artifact.placeholder ? 1 : 0);
    sqlite3_bind_int64(stmt, 23, static_cast<sqlite3_int64>(artifact.original_size));
    sqlite3_bind_int64(stmt, 24, static_cast<sqlite3_int64>(artifact.byte_size()));
    bind_blob(stmt, 25, artifact.pdf);
    bind_blob(stmt, 26, artifact.preview);
    sqlite3_bind_int64(stmt, 27, sqlite_database::to_epoch_ms(artifact.created_at));

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        auto error_msg = std::string(sqlite3_errmsg(db));
        sqlite3_finalize(stmt);
        return VoidResult(db_->write_error(
            rc, sgkdoc::compat::format("Failed to insert document {}: {}", artifact.id,
                                       error_msg)));
    }
    sqlite3_finalize(stmt);
    return ok();
}

// ============================================================================
// Queries
// ============================================================================

auto sqlite_document_store::list(std::optional<std::string_view> patient_id) const
    -> Result<std::vector<document_artifact>> {
    std::string sql = select_columns;
    if (patient_id) {
        sql += " WHERE patient_id = ?";
    }
    sql += " ORDER BY created_at, id;";

    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sgkdoc_error<std::vector<document_artifact>>(error_codes::storage_read_failed,
                                                            prepare_error(db));
    }
    if (patient_id) {
        bind_text(stmt, 1, *patient_id);
    }

    std::vector<document_artifact> artifacts;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        artifacts.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sgkdoc_error<std::vector<document_artifact>>(
            error_codes::storage_read_failed, "Failed to list documents",
            sqlite3_errstr(rc));
    }
    return artifacts;
}

auto sqlite_document_store::find_where(const char* column, std::string_view value) const
    -> Result<std::optional<document_artifact>> {
    using result_type = std::optional<document_artifact>;
    const auto sql = sgkdoc::compat::format("{} WHERE {} = ? LIMIT 1;", select_columns, column);

    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return sgkdoc_error<result_type>(error_codes::storage_read_failed, prepare_error(db));
    }
    bind_text(stmt, 1, value);

    result_type artifact;
    const auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        artifact = parse_row(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return sgkdoc_error<result_type>(
            error_codes::storage_read_failed,
            sgkdoc::compat::format("Failed to look up document by {}", column),
            sqlite3_errstr(rc));
    }
    return artifact;
}

auto sqlite_document_store::find(std::string_view artifact_id) const
    -> Result<std::optional<document_artifact>> {
    return find_where("id", artifact_id);
}

auto sqlite_document_store::find_by_run(std::string_view run_id) const
    -> Result<std::optional<document_artifact>> {
    return find_where("run_id", run_id);
}

auto sqlite_document_store::count() const -> std::size_t {
    auto guard = db_->lock();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_->handle(), "SELECT COUNT(*) FROM documents;", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return 0;
    }
    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

// ============================================================================
// Updates
// ============================================================================

auto sqlite_document_store::update(std::string_view artifact_id, const artifact_patch& patch)
    -> VoidResult {
    std::vector<std::string> assignments;
    if (patch.patient_id) assignments.emplace_back("patient_id = ?");
    if (patch.manual_assignment) assignments.emplace_back("manual_assignment = ?");
    if (patch.status) assignments.emplace_back("workflow_status = ?");
    if (patch.match_tier) assignments.emplace_back("match_tier = ?");
    if (patch.requires_confirmation) assignments.emplace_back("requires_confirmation = ?");

    auto guard = db_->lock();
    auto* db = db_->handle();

    if (assignments.empty()) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT 1 FROM documents WHERE id = ?;", -1, &stmt,
                               nullptr) != SQLITE_OK) {
            return sgkdoc_void_error(error_codes::storage_read_failed, prepare_error(db));
        }
        bind_text(stmt, 1, artifact_id);
        const bool exists = sqlite3_step(stmt) == SQLITE_ROW;
        sqlite3_finalize(stmt);
        if (!exists) {
            return sgkdoc_void_error(error_codes::artifact_not_found, "Belge bulunamadı",
                                     std::string(artifact_id));
        }
        return ok();
    }

    std::string sql = "UPDATE documents SET ";
    for (std::size_t i = 0; i < assignments.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += assignments[i];
    }
    sql += " WHERE id = ?;";

    // A status change and its history row are written together or not at all
    const bool with_history = patch.status.has_value();
    if (with_history) {
        auto begin = db_->execute("BEGIN IMMEDIATE;");
        if (begin.is_err()) {
            return begin;
        }
    }
    auto abort_write = [this, with_history](VoidResult failure) {
        if (with_history) {
            (void)db_->execute("ROLLBACK;");
        }
        return failure;
    };

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return abort_write(VoidResult(db_->write_error(rc, prepare_error(db))));
    }

    int index = 1;
    if (patch.patient_id) {
        if (patch.patient_id->empty()) {
            sqlite3_bind_null(stmt, index++);
        } else {
            bind_text(stmt, index++, *patch.patient_id);
        }
    }
    if (patch.manual_assignment) sqlite3_bind_int(stmt, index++, *patch.manual_assignment ? 1 : 0);
    if (patch.status) bind_text(stmt, index++, to_string(*patch.status));
    if (patch.match_tier) bind_text(stmt, index++, *patch.match_tier);
    if (patch.requires_confirmation) {
        sqlite3_bind_int(stmt, index++, *patch.requires_confirmation ? 1 : 0);
    }
    bind_text(stmt, index, artifact_id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return abort_write(VoidResult(db_->write_error(rc, "Failed to update document")));
    }
    if (sqlite3_changes(db) == 0) {
        return abort_write(sgkdoc_void_error(error_codes::artifact_not_found,
                                             "Belge bulunamadı", std::string(artifact_id)));
    }

    if (!with_history) {
        return ok();
    }

    sqlite3_stmt* history = nullptr;
    rc = sqlite3_prepare_v2(db,
                            "INSERT INTO document_workflow_history (document_id, status, "
                            "changed_at) VALUES (?, ?, ?);",
                            -1, &history, nullptr);
    if (rc != SQLITE_OK) {
        return abort_write(VoidResult(db_->write_error(rc, prepare_error(db))));
    }
    bind_text(history, 1, artifact_id);
    bind_text(history, 2, to_string(*patch.status));
    sqlite3_bind_int64(history, 3,
                       sqlite_database::to_epoch_ms(std::chrono::system_clock::now()));
    rc = sqlite3_step(history);
    sqlite3_finalize(history);
    if (rc != SQLITE_DONE) {
        return abort_write(
            VoidResult(db_->write_error(rc, "Failed to record workflow history")));
    }

    auto commit = db_->execute("COMMIT;");
    if (commit.is_err()) {
        return abort_write(commit);
    }
    return ok();
}

auto sqlite_document_store::update_workflow_for_patient(std::string_view patient_id,
                                                        workflow_status status)
    -> Result<std::size_t> {
    auto guard = db_->lock();
    auto* db = db_->handle();
    const auto now = sqlite_database::to_epoch_ms(std::chrono::system_clock::now());

    auto begin = db_->execute("BEGIN IMMEDIATE;");
    if (begin.is_err()) {
        return begin.error();
    }

    sqlite3_stmt* history = nullptr;
    auto rc = sqlite3_prepare_v2(db, R"(
        INSERT INTO document_workflow_history (document_id, status, changed_at)
        SELECT id, ?, ? FROM documents WHERE patient_id = ?;
    )", -1, &history, nullptr);
    if (rc != SQLITE_OK) {
        (void)db_->execute("ROLLBACK;");
        return db_->write_error(rc, prepare_error(db));
    }
    bind_text(history, 1, to_string(status));
    sqlite3_bind_int64(history, 2, now);
    bind_text(history, 3, patient_id);
    rc = sqlite3_step(history);
    sqlite3_finalize(history);
    if (rc != SQLITE_DONE) {
        (void)db_->execute("ROLLBACK;");
        return db_->write_error(rc, "Failed to record workflow history");
    }

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, "UPDATE documents SET workflow_status = ? WHERE patient_id = ?;",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        (void)db_->execute("ROLLBACK;");
        return db_->write_error(rc, prepare_error(db));
    }
    bind_text(stmt, 1, to_string(status));
    bind_text(stmt, 2, patient_id);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        (void)db_->execute("ROLLBACK;");
        return db_->write_error(rc, "Failed to update workflow status");
    }
    const auto changed = static_cast<std::size_t>(sqlite3_changes(db));

    auto commit = db_->execute("COMMIT;");
    if (commit.is_err()) {
        (void)db_->execute("ROLLBACK;");
        return commit.error();
    }
    return changed;
}

auto sqlite_document_store::workflow_history(std::string_view artifact_id) const
    -> Result<std::vector<artifact_status_change>> {
    auto guard = db_->lock();
    auto* db = db_->handle();

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db,
                                 "SELECT status, changed_at FROM document_workflow_history "
                                 "WHERE document_id = ? ORDER BY id;",
                                 -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sgkdoc_error<std::vector<artifact_status_change>>(
            error_codes::storage_read_failed, prepare_error(db));
    }
    bind_text(stmt, 1, artifact_id);

    std::vector<artifact_status_change> history;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto status = parse_workflow_status(sqlite_database::column_text(stmt, 0));
        if (!status) {
            continue;
        }
        history.push_back({*status, sqlite_database::from_epoch_ms(sqlite3_column_int64(stmt, 1))});
    }
    sqlite3_finalize(stmt);
    return history;
}

}  // namespace sgkdoc::storage
