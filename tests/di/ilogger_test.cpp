/**
 * @file ilogger_test.cpp
 * @brief Unit tests for the ILogger interface and its injection into components
 */

#include <sgkdoc/classification/document_classifier.hpp>
#include <sgkdoc/di/ilogger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace sgkdoc::di;
using sgkdoc::integration::log_level;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Mock logger that records all log calls for verification
 */
class MockLogger final : public ILogger {
public:
    void debug(std::string_view message) override { record(debug_count_, message); }
    void info(std::string_view message) override { record(info_count_, message); }
    void warn(std::string_view message) override { record(warn_count_, message); }
    void error(std::string_view message) override { record(error_count_, message); }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    [[nodiscard]] size_t debug_count() const noexcept { return debug_count_.load(); }
    [[nodiscard]] size_t info_count() const noexcept { return info_count_.load(); }
    [[nodiscard]] size_t warn_count() const noexcept { return warn_count_.load(); }
    [[nodiscard]] size_t error_count() const noexcept { return error_count_.load(); }

    [[nodiscard]] std::string last_message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_message_;
    }

    void set_enabled_level(log_level level) noexcept { enabled_level_ = level; }

private:
    void record(std::atomic<size_t>& counter, std::string_view message) {
        counter.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        last_message_ = std::string(message);
    }

    std::atomic<size_t> debug_count_{0};
    std::atomic<size_t> info_count_{0};
    std::atomic<size_t> warn_count_{0};
    std::atomic<size_t> error_count_{0};
    log_level enabled_level_{log_level::debug};
    mutable std::mutex mutex_;
    std::string last_message_;
};

class failing_classifier final : public sgkdoc::classification::external_classifier {
public:
    std::optional<sgkdoc::classification::external_classification> classify(
        std::string_view) override {
        throw std::runtime_error("model offline");
    }
};

}  // namespace

// =============================================================================
// Formatting helpers
// =============================================================================

TEST_CASE("ILogger formatting helpers", "[di][ilogger]") {
    MockLogger logger;

    SECTION("messages are formatted") {
        logger.info_fmt("Run {} committed {} bytes", "run_1", 1024);
        CHECK(logger.info_count() == 1);
        CHECK(logger.last_message() == "Run run_1 committed 1024 bytes");
    }

    SECTION("disabled levels are not formatted or delivered") {
        logger.set_enabled_level(log_level::warn);
        logger.debug_fmt("hidden {}", 1);
        logger.info_fmt("hidden {}", 2);
        logger.warn_fmt("shown {}", 3);
        logger.error_fmt("shown {}", 4);

        CHECK(logger.debug_count() == 0);
        CHECK(logger.info_count() == 0);
        CHECK(logger.warn_count() == 1);
        CHECK(logger.error_count() == 1);
        CHECK(logger.last_message() == "shown 4");
    }
}

TEST_CASE("NullLogger discards everything", "[di][ilogger]") {
    auto logger = null_logger();
    REQUIRE(logger != nullptr);
    CHECK(logger == null_logger());
    CHECK_FALSE(logger->is_enabled(log_level::fatal));

    logger->error_fmt("ignored {}", 1);
}

TEST_CASE("LoggerService is silent without logger_system", "[di][ilogger]") {
    sgkdoc::integration::logger_adapter::shutdown();
    LoggerService service("pipeline");
    CHECK_FALSE(service.is_enabled(log_level::error));
    service.info("not initialized");
}

// =============================================================================
// Injection
// =============================================================================

TEST_CASE("Components log through the injected logger", "[di][ilogger]") {
    using namespace sgkdoc::classification;

    auto logger = std::make_shared<MockLogger>();
    document_classifier classifier(std::make_shared<failing_classifier>(), logger);

    auto result = classifier.classify("Muayene raporu", "scan.jpg");
    CHECK(result.type == document_type::medical_report);
    CHECK(logger->warn_count() == 1);
    CHECK(logger->debug_count() == 1);
    CHECK(logger->last_message().find("rapor") != std::string::npos);
}
