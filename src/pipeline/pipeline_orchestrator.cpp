/**
 * @file pipeline_orchestrator.cpp
 * @brief Implementation of the document pipeline state machine
 */

#include "sgkdoc/pipeline/pipeline_orchestrator.hpp"

#include "sgkdoc/integration/logger_adapter.hpp"
#include "sgkdoc/integration/thread_adapter.hpp"
#include <sgkdoc/compat/format.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <random>
#include <thread>
#include <utility>

namespace sgkdoc::pipeline {

namespace {

constexpr std::string_view base36_digits = "0123456789abcdefghijklmnopqrstuvwxyz";

auto random_base36(std::size_t length) -> std::string {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, base36_digits.size() - 1);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(base36_digits[dist(engine)]);
    }
    return out;
}

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto is_terminal(pipeline_state state) -> bool {
    return state == pipeline_state::done || state == pipeline_state::failed ||
           state == pipeline_state::cancelled;
}

/// One OCR call that either the worker pool or a dedicated thread executes
struct ocr_call {
    std::atomic<bool> claimed{false};
    std::promise<void> started;
    std::promise<Result<ocr_result>> finished;
};

auto ocr_failure_message(std::string_view detail) -> std::string {
    return sgkdoc::compat::format("OCR işlemi başarısız: {}. Lütfen tekrar deneyin.", detail);
}

}  // namespace

std::string_view to_string(pipeline_state state) noexcept {
    switch (state) {
        case pipeline_state::uploaded: return "uploaded";
        case pipeline_state::rectifying: return "rectifying";
        case pipeline_state::extracting: return "extracting";
        case pipeline_state::resolving: return "resolving";
        case pipeline_state::classifying: return "classifying";
        case pipeline_state::packaging: return "packaging";
        case pipeline_state::persisting: return "persisting";
        case pipeline_state::done: return "done";
        case pipeline_state::failed: return "failed";
        case pipeline_state::cancelled: return "cancelled";
    }
    return "failed";
}

struct pipeline_orchestrator::run_context {
    std::string run_id;
    std::string file_name;
    pipeline_state state = pipeline_state::uploaded;
};

// ============================================================================
// Construction
// ============================================================================

pipeline_orchestrator::pipeline_orchestrator(pipeline_dependencies dependencies,
                                             orchestrator_config config)
    : deps_(std::move(dependencies)),
      config_(std::move(config)),
      logger_(deps_.logger ? deps_.logger : di::null_logger()),
      validator_(config_.pipeline),
      rectifier_(config_.rectifier, logger_),
      extractor_(logger_),
      resolver_(config_.resolver, logger_),
      classifier_(deps_.classifier, logger_),
      packager_(config_.packager, logger_) {
    if (!deps_.ocr || !deps_.directory || !deps_.store) {
        throw std::invalid_argument(
            "pipeline_orchestrator requires OCR, patient directory and document store");
    }
}

auto pipeline_orchestrator::generate_artifact_id() -> std::string {
    return sgkdoc::compat::format("sgk_doc_{}_{}", epoch_ms(), random_base36(9));
}

auto pipeline_orchestrator::generate_run_id() -> std::string {
    return sgkdoc::compat::format("run_{}_{}", epoch_ms(), random_base36(9));
}

// ============================================================================
// State and progress
// ============================================================================

void pipeline_orchestrator::transition(run_context& run, pipeline_state next) {
    logger_->debug_fmt("Run {}: {} -> {}", run.run_id, to_string(run.state), to_string(next));
    run.state = next;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_terminal(next)) {
        states_[run.run_id] = next;
        return;
    }

    states_.erase(run.run_id);
    if (finished_.insert_or_assign(run.run_id, next).second) {
        finished_order_.push_back(run.run_id);
    }
    while (finished_order_.size() > config_.pipeline.finished_run_history) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

void pipeline_orchestrator::report(int step) {
    if (!deps_.progress || step < 1 || step > progress_total) {
        return;
    }
    try {
        deps_.progress->on_progress(step, progress_total,
                                    progress_messages[static_cast<std::size_t>(step - 1)]);
    } catch (const std::exception& e) {
        logger_->warn_fmt("Progress sink threw: {}", e.what());
    }
}

auto pipeline_orchestrator::check_cancel(run_context& run, const cancellation_token& cancel)
    -> std::optional<error_info> {
    if (!cancel.is_cancelled()) {
        return std::nullopt;
    }
    logger_->info_fmt("Run {} cancelled before {}", run.run_id, to_string(run.state));
    transition(run, pipeline_state::cancelled);
    return error_info{error_codes::run_cancelled, "İşlem iptal edildi.", "sgkdoc", run.run_id};
}

auto pipeline_orchestrator::state_of(std::string_view run_id) const
    -> std::optional<pipeline_state> {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (auto it = states_.find(run_id); it != states_.end()) {
        return it->second;
    }
    if (auto it = finished_.find(run_id); it != finished_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto pipeline_orchestrator::active_runs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return states_.size();
}

auto pipeline_orchestrator::tracked_runs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::size_t count = finished_.size();
    for (const auto& [run_id, state] : states_) {
        if (finished_.find(run_id) == finished_.end()) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// OCR
// ============================================================================

auto pipeline_orchestrator::run_ocr(std::span<const uint8_t> image_bytes) -> Result<ocr_result> {
    auto service = deps_.ocr;
    auto bytes = std::make_shared<std::vector<uint8_t>>(image_bytes.begin(), image_bytes.end());
    auto call = std::make_shared<ocr_call>();
    auto started = call->started.get_future();
    auto pending = call->finished.get_future();

    // Whichever executor claims the call first runs it; the other returns
    auto job = [call, service, bytes]() {
        if (call->claimed.exchange(true)) {
            return;
        }
        call->started.set_value();
        try {
            call->finished.set_value(service->extract_text(*bytes));
        } catch (...) {
            call->finished.set_exception(std::current_exception());
        }
    };

    bool queued = false;
    if (config_.pipeline.use_worker_pool) {
        try {
            auto accepted = integration::thread_adapter::submit(job);
            queued = accepted.valid();
        } catch (const std::exception& e) {
            logger_->warn_fmt("Worker pool unavailable ({}); running OCR on a dedicated thread",
                              e.what());
        }
    }
    if (queued && started.wait_for(config_.pipeline.ocr_timeout) != std::future_status::ready) {
        logger_->warn("Worker pool busy; running OCR on a dedicated thread");
        queued = false;
    }
    if (!queued) {
        // Detached so a timed-out call cannot block this run
        std::thread(job).detach();
    }

    // The timeout covers the call itself, not the wait for a free worker
    started.wait();
    if (pending.wait_for(config_.pipeline.ocr_timeout) != std::future_status::ready) {
        return sgkdoc_error<ocr_result>(
            error_codes::ocr_timeout, ocr_failure_message("zaman aşımı"),
            sgkdoc::compat::format("no answer within {} ms",
                                   config_.pipeline.ocr_timeout.count()));
    }

    try {
        auto result = pending.get();
        if (result.is_err()) {
            return sgkdoc_error<ocr_result>(error_codes::ocr_failed,
                                            ocr_failure_message(result.error().message),
                                            result.error().message);
        }
        return result;
    } catch (const std::exception& e) {
        return sgkdoc_error<ocr_result>(error_codes::ocr_failed, ocr_failure_message(e.what()),
                                        e.what());
    }
}

// ============================================================================
// Process
// ============================================================================

auto pipeline_orchestrator::process(const uploaded_file& file, const cancellation_token& cancel)
    -> Result<run_result> {
    run_context run;
    run.run_id = file.run_id.empty() ? generate_run_id() : file.run_id;
    run.file_name = file.file_name;
    transition(run, pipeline_state::uploaded);

    // Validation happens before any stage; rejected uploads create no artifact
    if (auto valid = validator_.validate(file); valid.is_err()) {
        logger_->warn_fmt("Upload {} rejected: {}", file.file_name, valid.error().message);
        integration::logger_adapter::log_upload_rejected(file.file_name, valid.error().message);
        transition(run, pipeline_state::failed);
        return valid.error();
    }

    auto committed = deps_.store->find_by_run(run.run_id);
    if (committed.is_err()) {
        logger_->error_fmt("Run {}: commit lookup failed: {}", run.run_id,
                           committed.error().message);
        transition(run, pipeline_state::failed);
        return committed.error();
    }
    if (auto& existing = committed.value()) {
        logger_->info_fmt("Run {} already committed as {}", run.run_id, existing->id);
        transition(run, pipeline_state::done);
        run_result replay;
        replay.run_id = run.run_id;
        replay.artifact = std::move(*existing);
        replay.replayed = true;
        return replay;
    }

    run_result result;
    result.run_id = run.run_id;
    storage::document_artifact artifact;
    artifact.run_id = run.run_id;
    artifact.original_filename = file.file_name;
    artifact.media_type = file.media_type;
    artifact.original_size = file.size();

    // Rectifying
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::rectifying);
    report(1);

    const auto format = upload_validator::effective_format(file);
    const bool decodable =
        format == imaging::image_format::jpeg || format == imaging::image_format::png;

    geometry::rectified_image rectified;
    if (decodable) {
        rectified = rectifier_.rectify_encoded(file.bytes);
    } else {
        rectified.error = sgkdoc::compat::format("no raster decoder for {}",
                                                 imaging::to_string(format));
    }
    const bool have_raster = rectified.image.valid();
    artifact.boundary_detected = rectified.boundary_detected;
    artifact.detection_method = std::string(geometry::to_string(rectified.method));
    if (rectified.processing_applied) {
        artifact.processing_steps.emplace_back("edge_detection");
    }
    if (!have_raster) {
        logger_->info_fmt("Run {}: {}; continuing with original bytes", run.run_id,
                          rectified.error);
    }

    // Extracting
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::extracting);
    report(2);

    std::vector<uint8_t> ocr_input;
    if (have_raster) {
        if (auto codec = imaging::create_codec(imaging::image_format::jpeg)) {
            imaging::encode_options options;
            options.quality = 92;
            auto encoded = codec->encode(rectified.image, options);
            if (encoded.is_ok()) {
                ocr_input = std::move(encoded.value());
            }
        }
    }
    const std::span<const uint8_t> ocr_bytes =
        ocr_input.empty() ? std::span<const uint8_t>(file.bytes) : std::span<const uint8_t>(ocr_input);

    auto ocr = run_ocr(ocr_bytes);
    if (ocr.is_err()) {
        logger_->error_fmt("Run {}: {}", run.run_id, ocr.error().message);
        transition(run, pipeline_state::failed);
        return ocr.error();
    }
    artifact.ocr_text = ocr.value().text;
    artifact.ocr_confidence = ocr.value().confidence;
    if (!artifact.ocr_text.empty()) {
        artifact.processing_steps.emplace_back("ocr_completed");
    }
    result.entities = extractor_.extract(artifact.ocr_text);

    // Resolving
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::resolving);
    report(3);

    std::vector<patient> directory;
    if (auto patients = deps_.directory->all(); patients.is_ok()) {
        directory = std::move(patients.value());
    } else {
        logger_->warn_fmt("Patient directory unavailable: {}", patients.error().message);
    }
    result.identity = resolver_.resolve(result.entities, directory, artifact.ocr_text);

    const auto& identity = result.identity;
    artifact.patient_id = identity.matched_patient_id;
    artifact.match_confidence = identity.confidence;
    artifact.match_tier = std::string(matching::to_string(identity.tier));
    artifact.match_method = std::string(matching::to_string(identity.method));
    artifact.requires_confirmation = identity.requires_confirmation;
    if (identity.matched()) {
        artifact.processing_steps.emplace_back("patient_matched");
    }
    integration::logger_adapter::log_identity_resolved(
        run.run_id, identity.matched_patient_id.value_or(""),
        std::string(matching::to_string(identity.tier)), identity.confidence);

    // Classifying
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::classifying);
    report(4);

    result.classification = classifier_.classify(artifact.ocr_text, file.file_name);
    artifact.type = result.classification.type;
    artifact.classification_confidence = result.classification.confidence;
    artifact.classification_method =
        std::string(classification::to_string(result.classification.method));
    artifact.processing_steps.emplace_back("type_detected");

    // Packaging
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::packaging);
    report(5);

    packaging::filename_request naming;
    naming.tier = identity.tier;
    naming.type = result.classification.type;
    naming.classification_confidence = result.classification.confidence;
    naming.extracted_name = identity.query_name;
    if (identity.matched() && !identity.candidates.empty()) {
        naming.matched_name = identity.candidates.front().patient_name;
    }

    auto packaged = have_raster ? packager_.package(rectified.image, naming)
                                : packager_.package_undecodable(file.bytes, format, naming);
    artifact.processing_steps.emplace_back("pdf_converted");
    report(6);
    if (!packaged.attempts.empty()) {
        artifact.processing_steps.emplace_back("compressed");
    }

    artifact.filename = packaged.filename;
    artifact.within_budget = packaged.within_budget;
    artifact.placeholder = packaged.placeholder;
    artifact.pdf = std::move(packaged.bytes);
    result.compression_attempts = std::move(packaged.attempts);

    if (have_raster) {
        if (auto preview = packager_.make_preview(rectified.image); preview.is_ok()) {
            artifact.preview = std::move(preview.value());
        } else {
            logger_->warn_fmt("Preview not produced: {}", preview.error().message);
        }
    }

    // Persisting
    if (auto cancelled = check_cancel(run, cancel)) {
        return *cancelled;
    }
    transition(run, pipeline_state::persisting);
    report(7);

    artifact.id = generate_artifact_id();
    artifact.created_at = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_identity_[run.run_id] = result.identity;
    }

    auto stored = persist(run, std::move(artifact));
    if (stored.is_err()) {
        return stored.error();
    }

    result.artifact = std::move(stored.value());
    result.state = pipeline_state::done;
    report(8);
    return result;
}

auto pipeline_orchestrator::persist(run_context& run, storage::document_artifact artifact)
    -> Result<storage::document_artifact> {
    auto appended = deps_.store->append(artifact);
    if (appended.is_err()) {
        // A concurrent run with the same id may have committed first
        auto existing = deps_.store->find_by_run(run.run_id);
        if (existing.is_err()) {
            logger_->warn_fmt("Run {}: commit lookup failed: {}", run.run_id,
                              existing.error().message);
        } else if (existing.value()) {
            logger_->info_fmt("Run {} was committed concurrently as {}", run.run_id,
                              existing.value()->id);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                pending_.erase(run.run_id);
                pending_identity_.erase(run.run_id);
            }
            transition(run, pipeline_state::done);
            return std::move(*existing.value());
        }

        const auto& error = appended.error();
        logger_->error_fmt("Run {}: commit failed: {} ({})", run.run_id, error.message,
                           error.details.value_or(""));
        integration::logger_adapter::log_persist_failed(run.run_id, error.message);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            pending_[run.run_id] = std::move(artifact);
        }
        transition(run, pipeline_state::failed);
        return error;
    }

    std::optional<matching::identity_resolution> identity;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_.erase(run.run_id);
        if (auto it = pending_identity_.find(run.run_id); it != pending_identity_.end()) {
            identity = std::move(it->second);
            pending_identity_.erase(it);
        }
    }

    artifact.processing_steps.emplace_back("persisted");
    integration::logger_adapter::log_document_persisted(
        run.run_id, artifact.id, artifact.patient_id.value_or(""),
        std::string(classification::to_tag(artifact.type)), artifact.byte_size());
    logger_->info_fmt("Run {} committed {} ({} bytes, patient {})", run.run_id, artifact.id,
                      artifact.byte_size(), artifact.patient_id.value_or("-"));

    after_commit(artifact, identity);
    transition(run, pipeline_state::done);
    return artifact;
}

void pipeline_orchestrator::after_commit(
    storage::document_artifact& artifact,
    const std::optional<matching::identity_resolution>& identity) {
    if (!artifact.patient_id) {
        return;
    }

    if (identity && identity->matched()) {
        storage::identity_query query;
        query.run_id = artifact.run_id;
        query.confidence = identity->confidence;
        query.tier = identity->tier;
        query.queried_at = std::chrono::system_clock::now();
        auto stored = deps_.directory->set_last_identity_query(*artifact.patient_id, query);
        if (stored.is_err()) {
            logger_->warn_fmt("Identity query for {} not recorded: {}", *artifact.patient_id,
                              stored.error().message);
        }
    }

    apply_workflow(artifact);
}

void pipeline_orchestrator::apply_workflow(storage::document_artifact& artifact) {
    if (!config_.pipeline.update_workflow || !artifact.patient_id) {
        return;
    }

    constexpr auto status = storage::workflow_status::documents_uploaded;
    const auto note = sgkdoc::compat::format("{} yüklendi: {}",
                                             classification::display_name(artifact.type),
                                             artifact.filename);

    auto updated = deps_.directory->set_workflow_status(*artifact.patient_id, status, note);
    if (updated.is_err()) {
        logger_->warn_fmt("Workflow status of {} not updated: {}", *artifact.patient_id,
                          updated.error().message);
        return;
    }
    integration::logger_adapter::log_workflow_status_changed(
        *artifact.patient_id, std::string(storage::to_string(status)), note);

    auto documents = deps_.store->update_workflow_for_patient(*artifact.patient_id, status);
    if (documents.is_err()) {
        logger_->warn_fmt("Documents of {} keep their workflow status: {}",
                          *artifact.patient_id, documents.error().message);
        return;
    }
    artifact.status = status;
}

// ============================================================================
// Batch, retry and manual assignment
// ============================================================================

auto pipeline_orchestrator::process_batch(const std::vector<uploaded_file>& files,
                                          const cancellation_token& cancel)
    -> std::vector<Result<run_result>> {
    if (files.empty()) {
        return {};
    }

    std::size_t parallel = config_.pipeline.max_parallel_runs;
    if (parallel == 0) {
        parallel = integration::thread_adapter::get_config().worker_count;
    }
    parallel = std::clamp<std::size_t>(parallel, 1, files.size());

    std::vector<std::optional<Result<run_result>>> slots(files.size());
    std::atomic<std::size_t> next{0};

    auto drain = [this, &files, &slots, &next, &cancel]() {
        for (auto index = next++; index < files.size(); index = next++) {
            try {
                slots[index].emplace(process(files[index], cancel));
            } catch (const std::exception& e) {
                logger_->error_fmt("Batch run {} failed: {}", index, e.what());
                slots[index].emplace(sgkdoc_error<run_result>(
                    error_codes::internal_error, "İşlem başarısız oldu. Lütfen tekrar deneyin.",
                    e.what()));
            }
        }
    };

    std::vector<std::future<void>> lanes;
    lanes.reserve(parallel);
    for (std::size_t i = 0; i < parallel; ++i) {
        lanes.push_back(std::async(std::launch::async, drain));
    }
    for (auto& lane : lanes) {
        lane.get();
    }

    std::vector<Result<run_result>> results;
    results.reserve(files.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

auto pipeline_orchestrator::has_pending_commit(std::string_view run_id) const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_.find(run_id) != pending_.end();
}

auto pipeline_orchestrator::retry_persist(std::string_view run_id)
    -> Result<storage::document_artifact> {
    storage::document_artifact artifact;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = pending_.find(run_id);
        if (it == pending_.end()) {
            return sgkdoc_error<storage::document_artifact>(
                error_codes::no_pending_commit, "Bekleyen kayıt bulunamadı",
                std::string(run_id));
        }
        artifact = it->second;
    }

    run_context run;
    run.run_id = std::string(run_id);
    run.file_name = artifact.original_filename;
    run.state = pipeline_state::failed;
    transition(run, pipeline_state::persisting);
    logger_->info_fmt("Retrying commit of run {}", run.run_id);
    return persist(run, std::move(artifact));
}

auto pipeline_orchestrator::assign_patient(std::string_view artifact_id,
                                           std::string_view patient_id)
    -> Result<storage::document_artifact> {
    using result_type = storage::document_artifact;

    auto found = deps_.store->find(artifact_id);
    if (found.is_err()) {
        return found.error();
    }
    auto& artifact = found.value();
    if (!artifact) {
        return sgkdoc_error<result_type>(error_codes::artifact_not_found, "Belge bulunamadı",
                                         std::string(artifact_id));
    }
    auto target = deps_.directory->find(patient_id);
    if (!target) {
        return sgkdoc_error<result_type>(error_codes::patient_not_found, "Hasta bulunamadı",
                                         std::string(patient_id));
    }

    const auto previous = artifact->patient_id.value_or("");
    if (!previous.empty() && previous != patient_id) {
        auto prior = deps_.directory->find(previous);
        if (prior && prior->last_identity_query &&
            prior->last_identity_query->run_id == artifact->run_id) {
            auto cleared = deps_.directory->clear_last_identity_query(previous);
            if (cleared.is_err()) {
                logger_->warn_fmt("Identity query of {} not cleared: {}", previous,
                                  cleared.error().message);
            }
        }
    }

    storage::artifact_patch patch;
    patch.patient_id = std::string(patient_id);
    patch.manual_assignment = true;
    patch.requires_confirmation = false;
    auto updated = deps_.store->update(artifact_id, patch);
    if (updated.is_err()) {
        return updated.error();
    }

    integration::logger_adapter::log_manual_assignment(std::string(artifact_id), previous,
                                                       std::string(patient_id));
    logger_->info_fmt("Document {} assigned to patient {} (was {})", artifact_id, patient_id,
                      previous.empty() ? "-" : previous);

    artifact->patient_id = std::string(patient_id);
    artifact->manual_assignment = true;
    artifact->requires_confirmation = false;
    apply_workflow(*artifact);

    auto refreshed = deps_.store->find(artifact_id);
    if (refreshed.is_ok() && refreshed.value()) {
        return std::move(*refreshed.value());
    }
    return std::move(*artifact);
}

}  // namespace sgkdoc::pipeline
