/**
 * @file document_artifact.hpp
 * @brief Persisted record of one processed upload
 */

#ifndef SGKDOC_STORAGE_DOCUMENT_ARTIFACT_HPP
#define SGKDOC_STORAGE_DOCUMENT_ARTIFACT_HPP

#include "sgkdoc/classification/document_type.hpp"
#include "sgkdoc/storage/workflow_status.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sgkdoc::storage {

/**
 * @brief A packaged, classified, optionally patient-linked document
 *
 * The artifact refers to its patient by id only. After creation only the
 * patient link (manual assignment) and the workflow status change.
 */
struct document_artifact {
    /// "sgk_doc_<epoch ms>_<9 base36 chars>"
    std::string id;

    /// Pipeline run that produced the artifact; unique in the store
    std::string run_id;

    std::optional<std::string> patient_id;

    classification::document_type type = classification::document_type::other;
    std::string filename;
    std::string original_filename;
    std::string media_type;

    std::string ocr_text;
    double ocr_confidence = 0.0;

    double classification_confidence = 0.0;
    std::string classification_method;

    double match_confidence = 0.0;
    std::string match_tier;
    std::string match_method;
    bool requires_confirmation = false;

    std::optional<workflow_status> status;

    bool boundary_detected = false;

    /// "automatic", "fallback" or "none"
    std::string detection_method;

    /// Stage names in execution order
    std::vector<std::string> processing_steps;

    bool manual_assignment = false;

    bool within_budget = false;
    bool placeholder = false;

    std::size_t original_size = 0;

    std::vector<uint8_t> pdf;
    std::vector<uint8_t> preview;

    std::chrono::system_clock::time_point created_at{};

    [[nodiscard]] std::size_t byte_size() const noexcept { return pdf.size(); }
};

/**
 * @brief Partial update of an artifact; unset fields are left unchanged
 */
struct artifact_patch {
    /// New patient link; an empty string clears the link
    std::optional<std::string> patient_id;

    std::optional<bool> manual_assignment;
    std::optional<workflow_status> status;
    std::optional<std::string> match_tier;
    std::optional<bool> requires_confirmation;
};

/**
 * @brief Entry of an artifact's workflow history
 */
struct artifact_status_change {
    workflow_status status = workflow_status::inquiry_started;
    std::chrono::system_clock::time_point changed_at{};
};

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_DOCUMENT_ARTIFACT_HPP
