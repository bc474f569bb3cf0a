/**
 * @file workflow_status.hpp
 * @brief SGK reimbursement workflow statuses of a patient
 *
 * | Order | Status              | Label                  | Legacy   |
 * |-------|---------------------|------------------------|----------|
 * | 1     | inquiry_started     | Sorgulandı             | pending  |
 * | 2     | prescription_saved  | Reçete Kaydedildi      | approved |
 * | 3     | materials_delivered | Malzeme Teslim Edildi  | approved |
 * | 4     | documents_uploaded  | Belgeler Yüklendi      | approved |
 * | 5     | invoiced            | Faturalandı            | approved |
 * | 6     | payment_received    | Ödemesi Alındı         | paid     |
 */

#ifndef SGKDOC_STORAGE_WORKFLOW_STATUS_HPP
#define SGKDOC_STORAGE_WORKFLOW_STATUS_HPP

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace sgkdoc::storage {

enum class workflow_status {
    inquiry_started,
    prescription_saved,
    materials_delivered,
    documents_uploaded,
    invoiced,
    payment_received
};

inline constexpr std::array<workflow_status, 6> all_workflow_statuses = {
    workflow_status::inquiry_started,    workflow_status::prescription_saved,
    workflow_status::materials_delivered, workflow_status::documents_uploaded,
    workflow_status::invoiced,           workflow_status::payment_received,
};

[[nodiscard]] std::string_view to_string(workflow_status status) noexcept;

[[nodiscard]] std::string_view workflow_label(workflow_status status) noexcept;

[[nodiscard]] std::string_view workflow_description(workflow_status status) noexcept;

/// Position in the workflow, 1-based
[[nodiscard]] int workflow_order(workflow_status status) noexcept;

[[nodiscard]] std::vector<workflow_status> next_actions(workflow_status status);

/// "pending", "approved" or "paid"
[[nodiscard]] std::string_view legacy_status(workflow_status status) noexcept;

/**
 * @brief Parses a status name; legacy values are accepted
 *
 * pending -> inquiry_started, approved -> prescription_saved,
 * paid -> payment_received.
 */
[[nodiscard]] std::optional<workflow_status> parse_workflow_status(std::string_view text) noexcept;

}  // namespace sgkdoc::storage

#endif  // SGKDOC_STORAGE_WORKFLOW_STATUS_HPP
