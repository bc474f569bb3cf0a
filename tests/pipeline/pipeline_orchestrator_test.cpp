/**
 * @file pipeline_orchestrator_test.cpp
 * @brief Tests for the run state machine, persistence and manual assignment
 */

#include <catch2/catch_test_macros.hpp>

#include <sgkdoc/imaging/image_codec.hpp>
#include <sgkdoc/integration/thread_adapter.hpp>
#include <sgkdoc/pipeline/pipeline_orchestrator.hpp>
#include <sgkdoc/storage/document_store.hpp>
#include <sgkdoc/storage/patient_directory.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sgkdoc;
using namespace sgkdoc::pipeline;

namespace {

// =============================================================================
// Test doubles
// =============================================================================

class scripted_ocr final : public ocr_service {
public:
    explicit scripted_ocr(std::string text) : text_(std::move(text)) {}

    auto extract_text(std::span<const uint8_t> image_bytes) -> Result<ocr_result> override {
        ++calls;
        last_input_size = image_bytes.size();
        if (on_call) {
            on_call();
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throw_error) {
            throw std::runtime_error("engine crashed");
        }
        if (fail) {
            return sgkdoc_error<ocr_result>(error_codes::ocr_failed, "engine unavailable");
        }
        return ocr_result{text_, 0.87};
    }

    std::atomic<int> calls{0};
    std::atomic<std::size_t> last_input_size{0};
    std::chrono::milliseconds delay{0};
    bool fail = false;
    bool throw_error = false;
    std::function<void()> on_call;

private:
    std::string text_;
};

class recording_progress final : public progress_sink {
public:
    void on_progress(int step, int total, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        steps.push_back(step);
        last_total = total;
        last_message = std::string(message);
    }

    std::vector<int> steps;
    int last_total = 0;
    std::string last_message;

private:
    std::mutex mutex_;
};

/// Store whose appends can be made to fail like a full disk
class flaky_store final : public storage::document_store {
public:
    explicit flaky_store(std::shared_ptr<storage::document_store> inner)
        : inner_(std::move(inner)) {}

    auto append(const storage::document_artifact& artifact) -> VoidResult override {
        if (full) {
            return sgkdoc_void_error(error_codes::storage_quota_exceeded,
                                     std::string(storage::quota_exceeded_message));
        }
        return inner_->append(artifact);
    }

    auto list(std::optional<std::string_view> patient_id) const
        -> Result<std::vector<storage::document_artifact>> override {
        return inner_->list(patient_id);
    }

    auto find(std::string_view artifact_id) const
        -> Result<std::optional<storage::document_artifact>> override {
        return inner_->find(artifact_id);
    }

    auto find_by_run(std::string_view run_id) const
        -> Result<std::optional<storage::document_artifact>> override {
        if (unreadable) {
            return sgkdoc_error<std::optional<storage::document_artifact>>(
                error_codes::storage_read_failed, "database disk image is malformed");
        }
        return inner_->find_by_run(run_id);
    }

    auto update(std::string_view artifact_id, const storage::artifact_patch& patch)
        -> VoidResult override {
        return inner_->update(artifact_id, patch);
    }

    auto update_workflow_for_patient(std::string_view patient_id,
                                     storage::workflow_status status)
        -> Result<std::size_t> override {
        return inner_->update_workflow_for_patient(patient_id, status);
    }

    auto workflow_history(std::string_view artifact_id) const
        -> Result<std::vector<storage::artifact_status_change>> override {
        return inner_->workflow_history(artifact_id);
    }

    bool full = false;
    bool unreadable = false;

private:
    std::shared_ptr<storage::document_store> inner_;
};

// =============================================================================
// Fixture
// =============================================================================

/// OCR on a dedicated thread per call, independent of the shared pool
orchestrator_config dedicated_threads() {
    orchestrator_config config;
    config.pipeline.use_worker_pool = false;
    return config;
}

/// Starts the shared pool with a fixed size and stops it afterwards
struct worker_pool_guard {
    explicit worker_pool_guard(std::size_t workers) {
        integration::thread_adapter::shutdown(true);
        integration::worker_pool_config config;
        config.worker_count = workers;
        integration::thread_adapter::configure(config);
    }

    ~worker_pool_guard() {
        integration::thread_adapter::shutdown(true);
        integration::thread_adapter::configure(integration::worker_pool_config{});
    }
};

struct pipeline_fixture {
    explicit pipeline_fixture(std::string ocr_text,
                              orchestrator_config config = dedicated_threads()) {
        auto db = storage::sqlite_database::open(":memory:");
        REQUIRE(db.is_ok());
        database = db.value();

        sqlite_store = std::make_shared<storage::sqlite_document_store>(database);
        store = std::make_shared<flaky_store>(sqlite_store);
        directory = std::make_shared<storage::sqlite_patient_directory>(database);
        ocr = std::make_shared<scripted_ocr>(std::move(ocr_text));
        progress = std::make_shared<recording_progress>();

        REQUIRE(directory->upsert({"p1", "Ali Veli", "12345678950", "", ""}).is_ok());
        REQUIRE(directory->upsert({"p2", "Ayşe Yılmaz", "", "", ""}).is_ok());

        pipeline_dependencies deps;
        deps.ocr = ocr;
        deps.directory = directory;
        deps.store = store;
        deps.progress = progress;
        orchestrator = std::make_unique<pipeline_orchestrator>(deps, config);
    }

    std::shared_ptr<storage::sqlite_database> database;
    std::shared_ptr<storage::sqlite_document_store> sqlite_store;
    std::shared_ptr<flaky_store> store;
    std::shared_ptr<storage::sqlite_patient_directory> directory;
    std::shared_ptr<scripted_ocr> ocr;
    std::shared_ptr<recording_progress> progress;
    std::unique_ptr<pipeline_orchestrator> orchestrator;
};

/// Light page on a dark table, PNG encoded
uploaded_file photographed_page(std::string run_id = {}) {
    imaging::raster_image image;
    image.width = 400;
    image.height = 600;
    image.channels = 1;
    image.pixels.assign(static_cast<size_t>(image.width) * image.height, 30);
    for (uint32_t y = 60; y < 540; ++y) {
        for (uint32_t x = 50; x < 350; ++x) {
            image.pixels[static_cast<size_t>(y) * image.width + x] = 230;
        }
    }

    auto codec = imaging::create_codec(imaging::image_format::png);
    REQUIRE(codec);
    auto encoded = codec->encode(image, {});
    REQUIRE(encoded.is_ok());

    uploaded_file file;
    file.bytes = std::move(encoded.value());
    file.media_type = "image/png";
    file.file_name = "IMG_2041.png";
    file.run_id = std::move(run_id);
    return file;
}

const std::string matched_text = "ALİ VELİ\nTC: 12345678950\nReçete";
const std::string unmatched_text = "SOSYAL GÜVENLİK KURUMU RAPORU";

}  // namespace

// =============================================================================
// Happy path
// =============================================================================

TEST_CASE("Matched upload is packaged and committed", "[pipeline][orchestrator]") {
    pipeline_fixture fx(matched_text);

    auto result = fx.orchestrator->process(photographed_page());
    REQUIRE(result.is_ok());

    const auto& run = result.value();
    CHECK(run.state == pipeline_state::done);
    CHECK_FALSE(run.replayed);
    CHECK(fx.orchestrator->state_of(run.run_id) == pipeline_state::done);

    const auto& artifact = run.artifact;
    CHECK(artifact.patient_id == std::optional<std::string>("p1"));
    CHECK(artifact.type == classification::document_type::prescription);
    CHECK(artifact.match_tier == "high");
    CHECK_FALSE(artifact.requires_confirmation);
    CHECK(artifact.filename.rfind("ALI_VELI_Recete_", 0) == 0);
    CHECK(artifact.filename.size() > 4);
    CHECK_FALSE(artifact.pdf.empty());
    CHECK(artifact.pdf.size() <= fx.orchestrator->config().packager.target_bytes);
    CHECK_FALSE(artifact.preview.empty());
    CHECK(artifact.ocr_text == matched_text);
    CHECK(artifact.status == storage::workflow_status::documents_uploaded);

    for (const char* step :
         {"ocr_completed", "patient_matched", "type_detected", "pdf_converted", "persisted"}) {
        INFO(step);
        CHECK(std::find(artifact.processing_steps.begin(), artifact.processing_steps.end(),
                        step) != artifact.processing_steps.end());
    }

    CHECK(fx.ocr->calls == 1);
    CHECK(fx.sqlite_store->count() == 1);
    auto stored = fx.sqlite_store->find(artifact.id);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());

    SECTION("progress is reported once per step") {
        CHECK(fx.progress->steps == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8});
        CHECK(fx.progress->last_total == progress_total);
        CHECK(fx.progress->last_message == "Tamamlandı!");
    }

    SECTION("patient workflow and identity query are updated") {
        auto record = fx.directory->find("p1");
        REQUIRE(record.has_value());
        CHECK(record->current_status == storage::workflow_status::documents_uploaded);
        REQUIRE(record->last_identity_query.has_value());
        CHECK(record->last_identity_query->run_id == run.run_id);
        CHECK(record->last_identity_query->tier == matching::match_tier::high);

        auto history = fx.directory->status_history("p1");
        REQUIRE(history.is_ok());
        REQUIRE(history.value().size() == 1);
        CHECK(history.value().front().notes == "Reçete yüklendi: " + artifact.filename);
    }
}

TEST_CASE("Unmatched upload is stored without a patient", "[pipeline][orchestrator]") {
    pipeline_fixture fx(unmatched_text);

    auto result = fx.orchestrator->process(photographed_page());
    REQUIRE(result.is_ok());

    const auto& artifact = result.value().artifact;
    CHECK_FALSE(artifact.patient_id.has_value());
    CHECK(artifact.match_tier == "none");
    CHECK(artifact.filename.rfind("BILINMEYEN_HASTA_", 0) == 0);
    CHECK_FALSE(artifact.status.has_value());
    CHECK(result.value().identity.candidates.empty());

    auto record = fx.directory->find("p1");
    REQUIRE(record.has_value());
    CHECK_FALSE(record->current_status.has_value());
}

TEST_CASE("Uploaded PDF is passed through", "[pipeline][orchestrator]") {
    pipeline_fixture fx(unmatched_text);

    uploaded_file file;
    const std::string pdf = "%PDF-1.4\n1 0 obj\n<< >>\nendobj\ntrailer\n<< >>\n%%EOF\n";
    file.bytes.assign(pdf.begin(), pdf.end());
    file.media_type = "application/pdf";
    file.file_name = "rapor.pdf";

    auto result = fx.orchestrator->process(file);
    REQUIRE(result.is_ok());

    const auto& artifact = result.value().artifact;
    CHECK(artifact.pdf == file.bytes);
    CHECK(artifact.within_budget);
    CHECK_FALSE(artifact.boundary_detected);
    CHECK(artifact.preview.empty());
    CHECK(fx.ocr->last_input_size == file.bytes.size());
}

// =============================================================================
// Failure edges
// =============================================================================

TEST_CASE("Invalid uploads never reach OCR", "[pipeline][orchestrator][validation]") {
    pipeline_fixture fx(matched_text);

    auto file = photographed_page("run_invalid");
    file.media_type = "text/plain";

    auto result = fx.orchestrator->process(file);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::unsupported_media_type);
    CHECK(fx.ocr->calls == 0);
    CHECK(fx.sqlite_store->count() == 0);
    CHECK(fx.orchestrator->state_of("run_invalid") == pipeline_state::failed);
}

TEST_CASE("Cancellation stops a run at a stage boundary", "[pipeline][orchestrator][cancel]") {
    pipeline_fixture fx(matched_text);

    SECTION("before the first stage") {
        cancellation_token token;
        token.cancel();

        auto result = fx.orchestrator->process(photographed_page("run_cancel_early"), token);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::run_cancelled);
        CHECK(fx.ocr->calls == 0);
        CHECK(fx.orchestrator->state_of("run_cancel_early") == pipeline_state::cancelled);
    }

    SECTION("while OCR is running") {
        cancellation_token token;
        fx.ocr->on_call = [token]() mutable { token.cancel(); };

        auto result = fx.orchestrator->process(photographed_page("run_cancel_ocr"), token);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::run_cancelled);
        CHECK(fx.ocr->calls == 1);
        CHECK(fx.orchestrator->state_of("run_cancel_ocr") == pipeline_state::cancelled);
    }

    CHECK(fx.sqlite_store->count() == 0);
    CHECK_FALSE(fx.directory->find("p1")->current_status.has_value());
}

TEST_CASE("OCR failures fail the run", "[pipeline][orchestrator][ocr]") {
    auto config = dedicated_threads();
    config.pipeline.ocr_timeout = std::chrono::milliseconds(100);
    pipeline_fixture fx(matched_text, config);

    SECTION("service error") {
        fx.ocr->fail = true;
        auto result = fx.orchestrator->process(photographed_page("run_ocr_error"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::ocr_failed);
        CHECK(result.error().message.find("OCR işlemi başarısız") != std::string::npos);
        CHECK(fx.orchestrator->state_of("run_ocr_error") == pipeline_state::failed);
    }

    SECTION("service throws") {
        fx.ocr->throw_error = true;
        auto result = fx.orchestrator->process(photographed_page());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::ocr_failed);
    }

    SECTION("timeout") {
        fx.ocr->delay = std::chrono::milliseconds(1000);
        const auto started = std::chrono::steady_clock::now();
        auto result = fx.orchestrator->process(photographed_page());
        const auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::ocr_timeout);
        CHECK(elapsed < std::chrono::milliseconds(900));
    }

    CHECK(fx.sqlite_store->count() == 0);
}

// =============================================================================
// Worker pool
// =============================================================================

TEST_CASE("OCR on the worker pool", "[pipeline][orchestrator][pool]") {
    worker_pool_guard pool(2);

    orchestrator_config config;
    config.pipeline.use_worker_pool = true;
    config.pipeline.ocr_timeout = std::chrono::milliseconds(1000);
    pipeline_fixture fx(matched_text, config);

    SECTION("a run completes") {
        auto result = fx.orchestrator->process(photographed_page());
        REQUIRE(result.is_ok());
        CHECK(result.value().artifact.patient_id == std::optional<std::string>("p1"));
        CHECK(fx.ocr->calls == 1);
        CHECK(integration::thread_adapter::is_running());
    }

    SECTION("a call past the timeout fails the run") {
        fx.ocr->delay = std::chrono::milliseconds(2500);
        const auto started = std::chrono::steady_clock::now();
        auto result = fx.orchestrator->process(photographed_page("run_pool_slow"));
        const auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::ocr_timeout);
        CHECK(elapsed < std::chrono::milliseconds(2000));
        CHECK(fx.orchestrator->state_of("run_pool_slow") == pipeline_state::failed);
        CHECK(fx.sqlite_store->count() == 0);
    }

    SECTION("a batch larger than the pool does not time out") {
        fx.ocr->delay = std::chrono::milliseconds(300);

        std::vector<uploaded_file> files;
        for (int i = 1; i <= 6; ++i) {
            files.push_back(photographed_page("run_pool_batch_" + std::to_string(i)));
        }

        auto results = fx.orchestrator->process_batch(files);
        REQUIRE(results.size() == files.size());
        for (std::size_t i = 0; i < results.size(); ++i) {
            INFO("run " << i + 1);
            REQUIRE(results[i].is_ok());
            CHECK(results[i].value().run_id == files[i].run_id);
        }
        CHECK(fx.ocr->calls == 6);
        CHECK(fx.sqlite_store->count() == 6);
    }
}

TEST_CASE("Waiting for a busy worker does not count against the OCR timeout",
          "[pipeline][orchestrator][pool]") {
    worker_pool_guard pool(1);

    orchestrator_config config;
    config.pipeline.use_worker_pool = true;
    config.pipeline.max_parallel_runs = 3;
    config.pipeline.ocr_timeout = std::chrono::milliseconds(500);
    pipeline_fixture fx(matched_text, config);
    fx.ocr->delay = std::chrono::milliseconds(300);

    std::vector<uploaded_file> files;
    for (int i = 1; i <= 3; ++i) {
        files.push_back(photographed_page("run_queued_" + std::to_string(i)));
    }

    auto results = fx.orchestrator->process_batch(files);
    REQUIRE(results.size() == 3);
    for (const auto& result : results) {
        REQUIRE(result.is_ok());
    }
    CHECK(fx.ocr->calls == 3);
    CHECK(fx.sqlite_store->count() == 3);
}

// =============================================================================
// Run state
// =============================================================================

TEST_CASE("Finished runs are forgotten beyond the history limit",
          "[pipeline][orchestrator][state]") {
    auto config = dedicated_threads();
    config.pipeline.finished_run_history = 2;
    pipeline_fixture fx(matched_text, config);

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(fx.orchestrator->process(photographed_page("run_hist_" + std::to_string(i)))
                    .is_ok());
    }
    auto invalid = photographed_page("run_hist_5");
    invalid.bytes.clear();
    REQUIRE(fx.orchestrator->process(invalid).is_err());

    CHECK(fx.orchestrator->active_runs() == 0);
    CHECK(fx.orchestrator->tracked_runs() == 2);
    CHECK_FALSE(fx.orchestrator->state_of("run_hist_1").has_value());
    CHECK_FALSE(fx.orchestrator->state_of("run_hist_3").has_value());
    CHECK(fx.orchestrator->state_of("run_hist_4") == pipeline_state::done);
    CHECK(fx.orchestrator->state_of("run_hist_5") == pipeline_state::failed);
}

// =============================================================================
// Persistence
// =============================================================================

TEST_CASE("Failed commit is retried without re-running stages", "[pipeline][orchestrator][persist]") {
    pipeline_fixture fx(matched_text);
    fx.store->full = true;

    auto result = fx.orchestrator->process(photographed_page("run_full"));
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::storage_quota_exceeded);
    CHECK(result.error().message == storage::quota_exceeded_message);
    CHECK(fx.orchestrator->state_of("run_full") == pipeline_state::failed);
    CHECK(fx.orchestrator->has_pending_commit("run_full"));
    CHECK(fx.sqlite_store->count() == 0);

    SECTION("retry while still full keeps the commit pending") {
        auto retry = fx.orchestrator->retry_persist("run_full");
        REQUIRE(retry.is_err());
        CHECK(retry.error().code == error_codes::storage_quota_exceeded);
        CHECK(fx.orchestrator->has_pending_commit("run_full"));
    }

    SECTION("retry after space is freed commits once") {
        fx.store->full = false;
        auto retry = fx.orchestrator->retry_persist("run_full");
        REQUIRE(retry.is_ok());
        CHECK(retry.value().run_id == "run_full");
        CHECK(retry.value().patient_id == std::optional<std::string>("p1"));
        CHECK(fx.ocr->calls == 1);
        CHECK(fx.sqlite_store->count() == 1);
        CHECK_FALSE(fx.orchestrator->has_pending_commit("run_full"));
        CHECK(fx.orchestrator->state_of("run_full") == pipeline_state::done);

        auto again = fx.orchestrator->retry_persist("run_full");
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::no_pending_commit);
    }
}

TEST_CASE("A committed run id is replayed, not duplicated", "[pipeline][orchestrator][persist]") {
    pipeline_fixture fx(matched_text);

    auto first = fx.orchestrator->process(photographed_page("run_fixed"));
    REQUIRE(first.is_ok());
    auto second = fx.orchestrator->process(photographed_page("run_fixed"));
    REQUIRE(second.is_ok());

    CHECK(second.value().replayed);
    CHECK(second.value().artifact.id == first.value().artifact.id);
    CHECK(fx.ocr->calls == 1);
    CHECK(fx.sqlite_store->count() == 1);
}

TEST_CASE("An unreadable store fails the run before any stage",
          "[pipeline][orchestrator][persist]") {
    pipeline_fixture fx(matched_text);
    fx.store->unreadable = true;

    auto result = fx.orchestrator->process(photographed_page("run_unreadable"));
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::storage_read_failed);
    CHECK(fx.ocr->calls == 0);
    CHECK(fx.orchestrator->state_of("run_unreadable") == pipeline_state::failed);
}

TEST_CASE("Batch runs keep input order", "[pipeline][orchestrator][batch]") {
    pipeline_fixture fx(matched_text);

    std::vector<uploaded_file> files;
    files.push_back(photographed_page("run_batch_1"));
    files.push_back(photographed_page("run_batch_2"));
    auto invalid = photographed_page("run_batch_3");
    invalid.bytes.clear();
    files.push_back(invalid);

    auto results = fx.orchestrator->process_batch(files);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].is_ok());
    REQUIRE(results[1].is_ok());
    CHECK(results[0].value().run_id == "run_batch_1");
    CHECK(results[1].value().run_id == "run_batch_2");
    REQUIRE(results[2].is_err());
    CHECK(results[2].error().code == error_codes::empty_file);

    CHECK(fx.sqlite_store->count() == 2);
    CHECK(results[0].value().artifact.id != results[1].value().artifact.id);
}

// =============================================================================
// Manual assignment
// =============================================================================

TEST_CASE("Manual assignment relinks an artifact", "[pipeline][orchestrator][assign]") {
    SECTION("unmatched document is assigned") {
        pipeline_fixture fx(unmatched_text);
        auto run = fx.orchestrator->process(photographed_page());
        REQUIRE(run.is_ok());

        auto assigned = fx.orchestrator->assign_patient(run.value().artifact.id, "p2");
        REQUIRE(assigned.is_ok());
        CHECK(assigned.value().patient_id == std::optional<std::string>("p2"));
        CHECK(assigned.value().manual_assignment);
        CHECK_FALSE(assigned.value().requires_confirmation);
        CHECK(assigned.value().status == storage::workflow_status::documents_uploaded);

        auto record = fx.directory->find("p2");
        REQUIRE(record.has_value());
        CHECK(record->current_status == storage::workflow_status::documents_uploaded);
    }

    SECTION("reassignment clears the previous identity query") {
        pipeline_fixture fx(matched_text);
        auto run = fx.orchestrator->process(photographed_page());
        REQUIRE(run.is_ok());
        REQUIRE(fx.directory->find("p1")->last_identity_query.has_value());

        auto assigned = fx.orchestrator->assign_patient(run.value().artifact.id, "p2");
        REQUIRE(assigned.is_ok());
        CHECK_FALSE(fx.directory->find("p1")->last_identity_query.has_value());

        auto p1_documents = fx.sqlite_store->list("p1");
        REQUIRE(p1_documents.is_ok());
        CHECK(p1_documents.value().empty());
    }

    SECTION("unknown artifact or patient") {
        pipeline_fixture fx(unmatched_text);
        auto run = fx.orchestrator->process(photographed_page());
        REQUIRE(run.is_ok());

        auto no_artifact = fx.orchestrator->assign_patient("sgk_doc_missing", "p1");
        REQUIRE(no_artifact.is_err());
        CHECK(no_artifact.error().code == error_codes::artifact_not_found);

        auto no_patient = fx.orchestrator->assign_patient(run.value().artifact.id, "p404");
        REQUIRE(no_patient.is_err());
        CHECK(no_patient.error().code == error_codes::patient_not_found);
        auto stored = fx.sqlite_store->find(run.value().artifact.id);
        REQUIRE(stored.is_ok());
        REQUIRE(stored.value().has_value());
        CHECK_FALSE(stored.value()->patient_id.has_value());
    }
}

// =============================================================================
// Identifiers
// =============================================================================

TEST_CASE("Generated identifiers", "[pipeline][orchestrator][ids]") {
    const std::regex artifact_pattern("^sgk_doc_[0-9]+_[0-9a-z]{9}$");
    const std::regex run_pattern("^run_[0-9]+_[0-9a-z]{9}$");

    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto artifact_id = pipeline_orchestrator::generate_artifact_id();
        auto run_id = pipeline_orchestrator::generate_run_id();
        CHECK(std::regex_match(artifact_id, artifact_pattern));
        CHECK(std::regex_match(run_id, run_pattern));
        seen.insert(artifact_id);
    }
    CHECK(seen.size() == 50);
}

TEST_CASE("Orchestrator requires its collaborators", "[pipeline][orchestrator]") {
    pipeline_dependencies deps;
    CHECK_THROWS_AS(pipeline_orchestrator(deps), std::invalid_argument);
}
