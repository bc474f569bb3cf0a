/**
 * @file document_store.hpp
 * @brief Abstract artifact store and its SQLite implementation
 */

#ifndef SGKDOC_STORAGE_DOCUMENT_STORE_HPP
#define SGKDOC_STORAGE_DOCUMENT_STORE_HPP

#include "sgkdoc/storage/document_artifact.hpp"
#include "sgkdoc/storage/sqlite_database.hpp"
#include <sgkdoc/core/result.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::storage {

/**
 * @brief Write target of the pipeline
 *
 * Thread Safety: implementations serialize writes; concurrent runs must not
 * lose each other's appends.
 */
class document_store {
public:
    virtual ~document_store() = default;

    /**
     * @brief Persists a new artifact
     *
     * @return storage_quota_exceeded when capacity is exhausted,
     *         storage_write_failed for any other rejected write (including a
     *         duplicate id or run id)
     */
    [[nodiscard]] virtual auto append(const document_artifact& artifact) -> VoidResult = 0;

    /**
     * @brief Artifacts in creation order, optionally for one patient
     */
    [[nodiscard]] virtual auto list(std::optional<std::string_view> patient_id = std::nullopt)
        const -> Result<std::vector<document_artifact>> = 0;

    /**
     * @return std::nullopt when no artifact has @p artifact_id;
     *         storage_read_failed when the lookup itself failed
     */
    [[nodiscard]] virtual auto find(std::string_view artifact_id) const
        -> Result<std::optional<document_artifact>> = 0;

    [[nodiscard]] virtual auto find_by_run(std::string_view run_id) const
        -> Result<std::optional<document_artifact>> = 0;

    /**
     * @return artifact_not_found when no artifact has @p artifact_id
     */
    [[nodiscard]] virtual auto update(std::string_view artifact_id, const artifact_patch& patch)
        -> VoidResult = 0;

    /**
     * @brief Sets the workflow status of every artifact linked to a patient
     * and appends it to their histories
     *
     * @return Number of artifacts updated
     */
    [[nodiscard]] virtual auto update_workflow_for_patient(std::string_view patient_id,
                                                           workflow_status status)
        -> Result<std::size_t> = 0;

    [[nodiscard]] virtual auto workflow_history(std::string_view artifact_id) const
        -> Result<std::vector<artifact_status_change>> = 0;

protected:
    document_store() = default;
    document_store(const document_store&) = default;
    auto operator=(const document_store&) -> document_store& = default;
};

/**
 * @class sqlite_document_store
 * @brief document_store over the shared SQLite connection
 *
 * PDF and preview are stored as BLOBs in the documents table. The run id
 * column is UNIQUE, so a second commit of the same run is rejected by the
 * database even if callers race.
 */
class sqlite_document_store final : public document_store {
public:
    explicit sqlite_document_store(std::shared_ptr<sqlite_database> database);

    [[nodiscard]] auto append(const document_artifact& artifact) -> VoidResult override;

    [[nodiscard]] auto list(std::optional<std::string_view> patient_id = std::nullopt) const
        -> Result<std::vector<document_artifact>> override;

    [[nodiscard]] auto find(std::string_view artifact_id) const
        -> Result<std::optional<document_artifact>> override;

    [[nodiscard]] auto find_by_run(std::string_view run_id) const
        -> Result<std::optional<document_artifact>> override;

    [[nodiscard]] auto update(std::string_view artifact_id, const artifact_patch& patch)
        -> VoidResult override;

    [[nodiscard]] auto update_workflow_for_patient(std::string_view patient_id,
                                                   workflow_status status)
        -> Result<std::size_t> override;

    [[nodiscard]] auto workflow_history(std::string_view artifact_id) const
        -> Result<std::vector<artifact_status_change>> override;

    /// Number of stored artifacts
    [[nodiscard]] auto count() const -> std::size_t;

private:
    [[nodiscard]] auto find_where(const char* column, std::string_view value) const
        -> Result<std::optional<document_artifact>>;

    std::shared_ptr<sqlite_database> db_;
};

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_DOCUMENT_STORE_HPP
