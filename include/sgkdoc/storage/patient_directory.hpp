/**
 * @file patient_directory.hpp
 * @brief Read access to patients plus the workflow and identity-query hooks
 */

#ifndef SGKDOC_STORAGE_PATIENT_DIRECTORY_HPP
#define SGKDOC_STORAGE_PATIENT_DIRECTORY_HPP

#include "sgkdoc/matching/identity_resolver.hpp"
#include "sgkdoc/storage/sqlite_database.hpp"
#include "sgkdoc/storage/workflow_status.hpp"
#include <sgkdoc/core/patient.hpp>
#include <sgkdoc/core/result.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::storage {

/**
 * @brief Most recent identity query that selected a patient
 *
 * Replaced by every new query for the patient and cleared when the artifact
 * of that query is reassigned to someone else.
 */
struct identity_query {
    std::string run_id;
    double confidence = 0.0;
    matching::match_tier tier = matching::match_tier::none;
    std::chrono::system_clock::time_point queried_at{};
};

/**
 * @brief Entry of a patient's append-only workflow history
 */
struct status_entry {
    workflow_status status = workflow_status::inquiry_started;
    std::string label;
    std::string description;
    std::string notes;
    std::chrono::system_clock::time_point changed_at{};
};

struct patient_record {
    patient info;
    std::optional<workflow_status> current_status;

    /// pending / approved / paid
    std::string legacy_status;

    std::optional<identity_query> last_identity_query;
};

/**
 * @brief Patient collaborator of the pipeline
 *
 * The pipeline reads patients for matching; it never creates or deletes
 * them. upsert() exists for seeding the directory.
 */
class patient_directory {
public:
    virtual ~patient_directory() = default;

    [[nodiscard]] virtual auto all() const -> Result<std::vector<patient>> = 0;

    [[nodiscard]] virtual auto find(std::string_view patient_id) const
        -> std::optional<patient_record> = 0;

    [[nodiscard]] virtual auto upsert(const patient& p) -> VoidResult = 0;

    /**
     * @brief Sets the current status and appends it to the history
     *
     * @return patient_not_found for an unknown id
     */
    [[nodiscard]] virtual auto set_workflow_status(std::string_view patient_id,
                                                   workflow_status status,
                                                   std::string_view notes) -> VoidResult = 0;

    [[nodiscard]] virtual auto status_history(std::string_view patient_id) const
        -> Result<std::vector<status_entry>> = 0;

    [[nodiscard]] virtual auto set_last_identity_query(std::string_view patient_id,
                                                       const identity_query& query)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto clear_last_identity_query(std::string_view patient_id)
        -> VoidResult = 0;

protected:
    patient_directory() = default;
    patient_directory(const patient_directory&) = default;
    auto operator=(const patient_directory&) -> patient_directory& = default;
};

/**
 * @class sqlite_patient_directory
 * @brief patient_directory over the shared SQLite connection
 */
class sqlite_patient_directory final : public patient_directory {
public:
    explicit sqlite_patient_directory(std::shared_ptr<sqlite_database> database);

    [[nodiscard]] auto all() const -> Result<std::vector<patient>> override;

    [[nodiscard]] auto find(std::string_view patient_id) const
        -> std::optional<patient_record> override;

    [[nodiscard]] auto upsert(const patient& p) -> VoidResult override;

    [[nodiscard]] auto set_workflow_status(std::string_view patient_id, workflow_status status,
                                           std::string_view notes) -> VoidResult override;

    [[nodiscard]] auto status_history(std::string_view patient_id) const
        -> Result<std::vector<status_entry>> override;

    [[nodiscard]] auto set_last_identity_query(std::string_view patient_id,
                                               const identity_query& query)
        -> VoidResult override;

    [[nodiscard]] auto clear_last_identity_query(std::string_view patient_id)
        -> VoidResult override;

private:
    [[nodiscard]] auto exists(std::string_view patient_id) const -> bool;

    std::shared_ptr<sqlite_database> db_;
};

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_PATIENT_DIRECTORY_HPP
