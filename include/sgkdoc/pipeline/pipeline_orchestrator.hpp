/**
 * @file pipeline_orchestrator.hpp
 * @brief Runs one upload through rectification, OCR, matching,
 * classification, packaging and persistence
 *
 * State machine of a run:
 *
 * @code
 * Uploaded -> Rectifying -> Extracting -> Resolving -> Classifying
 *          -> Packaging -> Persisting -> Done
 *
 * Uploaded   --(validation)------> Failed
 * Extracting --(OCR error/timeout)-> Failed
 * Persisting --(store rejected)---> Failed   (packaged bytes retained)
 * any stage boundary --(cancel)---> Cancelled
 * @endcode
 *
 * Rectification, resolution, classification and packaging always yield a
 * (possibly degraded) result, so they have no failure edge.
 */

#ifndef SGKDOC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP
#define SGKDOC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP

#include "sgkdoc/classification/document_classifier.hpp"
#include "sgkdoc/extraction/entity_extractor.hpp"
#include "sgkdoc/geometry/geometry_rectifier.hpp"
#include "sgkdoc/matching/identity_resolver.hpp"
#include "sgkdoc/packaging/document_packager.hpp"
#include "sgkdoc/pipeline/collaborators.hpp"
#include "sgkdoc/pipeline/pipeline_config.hpp"
#include "sgkdoc/pipeline/upload_validator.hpp"
#include "sgkdoc/storage/document_store.hpp"
#include "sgkdoc/storage/patient_directory.hpp"
#include <sgkdoc/core/result.hpp>
#include <sgkdoc/di/ilogger.hpp>

#include <array>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::pipeline {

enum class pipeline_state {
    uploaded,
    rectifying,
    extracting,
    resolving,
    classifying,
    packaging,
    persisting,
    done,
    failed,
    cancelled
};

[[nodiscard]] std::string_view to_string(pipeline_state state) noexcept;

/// Progress messages, one per reported step
inline constexpr std::array<std::string_view, 8> progress_messages = {
    "Belge kenarları tespit ediliyor...",
    "Metin çıkarılıyor (OCR)...",
    "Hasta eşleştiriliyor...",
    "Belge türü tespit ediliyor...",
    "PDF'e dönüştürülüyor...",
    "PDF sıkıştırılıyor...",
    "Dosya kaydediliyor...",
    "Tamamlandı!",
};

inline constexpr int progress_total = static_cast<int>(progress_messages.size());

/**
 * @brief Collaborators of the orchestrator
 *
 * ocr, directory and store are required; classifier and progress are
 * optional.
 */
struct pipeline_dependencies {
    std::shared_ptr<ocr_service> ocr;
    std::shared_ptr<storage::patient_directory> directory;
    std::shared_ptr<storage::document_store> store;
    std::shared_ptr<classification::external_classifier> classifier;
    std::shared_ptr<progress_sink> progress;
    std::shared_ptr<di::ILogger> logger;
};

struct orchestrator_config {
    pipeline_config pipeline;
    geometry::rectifier_config rectifier;
    matching::resolver_config resolver;
    packaging::packager_config packager;
};

/**
 * @brief Everything a completed run produced
 */
struct run_result {
    std::string run_id;
    pipeline_state state = pipeline_state::done;

    storage::document_artifact artifact;

    /// Stage outputs; default-constructed when the run was replayed
    extraction::extracted_entities entities;
    matching::identity_resolution identity;
    classification::classification_result classification;
    std::vector<packaging::compression_attempt> compression_attempts;

    /// The run id had already been committed; the stored artifact is returned
    bool replayed = false;
};

/**
 * @class pipeline_orchestrator
 * @brief Sequences the pipeline stages for uploaded files
 *
 * Each run is single-threaded; process_batch() executes several runs
 * concurrently. The only shared state is the patient directory (read) and
 * the document store (serialized writes). A run commits at most one
 * artifact, keyed by its run id.
 *
 * Thread Safety: all public methods may be called concurrently.
 */
class pipeline_orchestrator {
public:
    pipeline_orchestrator(pipeline_dependencies dependencies, orchestrator_config config = {});

    pipeline_orchestrator(const pipeline_orchestrator&) = delete;
    auto operator=(const pipeline_orchestrator&) -> pipeline_orchestrator& = delete;

    /**
     * @brief Runs one upload to completion
     *
     * @return ValidationError codes, ocr_failed / ocr_timeout, run_cancelled,
     *         or storage_quota_exceeded / storage_write_failed (in which case
     *         retry_persist() can finish the run)
     */
    [[nodiscard]] auto process(const uploaded_file& file,
                               const cancellation_token& cancel = {}) -> Result<run_result>;

    /**
     * @brief Runs several uploads concurrently; results keep input order
     *
     * At most pipeline_config::max_parallel_runs runs (by default the worker
     * pool size) execute at once.
     */
    [[nodiscard]] auto process_batch(const std::vector<uploaded_file>& files,
                                     const cancellation_token& cancel = {})
        -> std::vector<Result<run_result>>;

    /**
     * @brief Re-attempts only the store step of a run that failed to persist
     *
     * @return no_pending_commit when the run has nothing waiting
     */
    [[nodiscard]] auto retry_persist(std::string_view run_id) -> Result<storage::document_artifact>;

    [[nodiscard]] auto has_pending_commit(std::string_view run_id) const -> bool;

    /**
     * @brief Links an artifact to a patient chosen by the user
     *
     * Clears the previous patient's cached identity query when it came from
     * this artifact and re-runs the workflow hook for the new patient.
     */
    [[nodiscard]] auto assign_patient(std::string_view artifact_id, std::string_view patient_id)
        -> Result<storage::document_artifact>;

    /**
     * @brief Last known state of a run
     *
     * Finished runs are remembered up to pipeline_config::finished_run_history,
     * oldest first out.
     */
    [[nodiscard]] auto state_of(std::string_view run_id) const -> std::optional<pipeline_state>;

    /// Runs that have not reached a terminal state
    [[nodiscard]] auto active_runs() const -> std::size_t;

    /// Runs with a queryable state, active or finished
    [[nodiscard]] auto tracked_runs() const -> std::size_t;

    /// "sgk_doc_<epoch ms>_<9 base36 chars>"
    [[nodiscard]] static auto generate_artifact_id() -> std::string;

    [[nodiscard]] static auto generate_run_id() -> std::string;

    [[nodiscard]] auto config() const noexcept -> const orchestrator_config& { return config_; }

private:
    struct run_context;

    void transition(run_context& run, pipeline_state next);
    void report(int step);
    [[nodiscard]] auto check_cancel(run_context& run, const cancellation_token& cancel)
        -> std::optional<error_info>;

    [[nodiscard]] auto run_ocr(std::span<const uint8_t> image_bytes) -> Result<ocr_result>;

    [[nodiscard]] auto persist(run_context& run, storage::document_artifact artifact)
        -> Result<storage::document_artifact>;

    void after_commit(storage::document_artifact& artifact,
                      const std::optional<matching::identity_resolution>& identity);

    void apply_workflow(storage::document_artifact& artifact);

    pipeline_dependencies deps_;
    orchestrator_config config_;
    std::shared_ptr<di::ILogger> logger_;

    upload_validator validator_;
    geometry::geometry_rectifier rectifier_;
    extraction::entity_extractor extractor_;
    matching::identity_resolver resolver_;
    classification::document_classifier classifier_;
    packaging::document_packager packager_;

    mutable std::mutex state_mutex_;
    std::map<std::string, pipeline_state, std::less<>> states_;
    std::map<std::string, pipeline_state, std::less<>> finished_;
    std::deque<std::string> finished_order_;
    std::map<std::string, storage::document_artifact, std::less<>> pending_;
    std::map<std::string, std::optional<matching::identity_resolution>, std::less<>>
        pending_identity_;
};

}  // namespace sgkdoc::pipeline

#endif  // SGKDOC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP
