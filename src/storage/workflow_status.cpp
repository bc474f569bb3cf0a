/**
 * @file workflow_status.cpp
 * @brief Workflow status metadata
 */

#include "sgkdoc/storage/workflow_status.hpp"

namespace sgkdoc::storage {

std::string_view to_string(workflow_status status) noexcept {
    switch (status) {
        case workflow_status::inquiry_started: return "inquiry_started";
        case workflow_status::prescription_saved: return "prescription_saved";
        case workflow_status::materials_delivered: return "materials_delivered";
        case workflow_status::documents_uploaded: return "documents_uploaded";
        case workflow_status::invoiced: return "invoiced";
        case workflow_status::payment_received: return "payment_received";
    }
    return "inquiry_started";
}

std::string_view workflow_label(workflow_status status) noexcept {
    switch (status) {
        case workflow_status::inquiry_started: return "Sorgulandı";
        case workflow_status::prescription_saved: return "Reçete Kaydedildi";
        case workflow_status::materials_delivered: return "Malzeme Teslim Edildi";
        case workflow_status::documents_uploaded: return "Belgeler Yüklendi";
        case workflow_status::invoiced: return "Faturalandı";
        case workflow_status::payment_received: return "Ödemesi Alındı";
    }
    return "";
}

std::string_view workflow_description(workflow_status status) noexcept {
    switch (status) {
        case workflow_status::inquiry_started: return "SGK sorgusu yapıldı";
        case workflow_status::prescription_saved: return "Reçete sisteme kaydedildi";
        case workflow_status::materials_delivered: return "Cihaz/malzeme hastaya teslim edildi";
        case workflow_status::documents_uploaded: return "Gerekli belgeler sisteme yüklendi";
        case workflow_status::invoiced: return "Fatura kesildi ve gönderildi";
        case workflow_status::payment_received: return "Ödeme tamamlandı";
    }
    return "";
}

int workflow_order(workflow_status status) noexcept {
    return static_cast<int>(status) + 1;
}

std::vector<workflow_status> next_actions(workflow_status status) {
    if (status == workflow_status::payment_received) {
        return {};
    }
    return {static_cast<workflow_status>(static_cast<int>(status) + 1)};
}

std::string_view legacy_status(workflow_status status) noexcept {
    switch (status) {
        case workflow_status::inquiry_started: return "pending";
        case workflow_status::payment_received: return "paid";
        default: return "approved";
    }
}

std::optional<workflow_status> parse_workflow_status(std::string_view text) noexcept {
    for (auto status : all_workflow_statuses) {
        if (to_string(status) == text) {
            return status;
        }
    }
    if (text == "pending") return workflow_status::inquiry_started;
    if (text == "approved") return workflow_status::prescription_saved;
    if (text == "paid") return workflow_status::payment_received;
    return std::nullopt;
}

}  // namespace sgkdoc::storage
