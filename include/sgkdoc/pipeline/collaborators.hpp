/**
 * @file collaborators.hpp
 * @brief Interfaces the pipeline calls out to: OCR, progress reporting and
 * cancellation
 */

#ifndef SGKDOC_PIPELINE_COLLABORATORS_HPP
#define SGKDOC_PIPELINE_COLLABORATORS_HPP

#include <sgkdoc/core/result.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace sgkdoc::pipeline {

struct ocr_result {
    std::string text;
    double confidence = 0.0;
};

/**
 * @brief External text recognition
 *
 * Implementations may block; the orchestrator enforces its own timeout.
 * Returning an error or throwing fails the run with ocr_failed.
 */
class ocr_service {
public:
    virtual ~ocr_service() = default;

    [[nodiscard]] virtual auto extract_text(std::span<const uint8_t> image_bytes)
        -> Result<ocr_result> = 0;
};

/**
 * @brief Receives one (step, total, message) tuple per stage transition
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    virtual void on_progress(int step, int total, std::string_view message) = 0;
};

/**
 * @brief Cooperative cancellation flag shared between a caller and a run
 *
 * Copies share the same flag. The orchestrator checks it at every stage
 * boundary; a run that has started persisting is no longer cancelled.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace sgkdoc::pipeline

#endif  // SGKDOC_PIPELINE_COLLABORATORS_HPP
