/**
 * @file config_loader_test.cpp
 * @brief Unit tests for JSON configuration and environment overrides
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/config/config_loader.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace sgkdoc;
using namespace sgkdoc::config;
using Catch::Matchers::WithinAbs;

namespace {

/// Sets an environment variable for the lifetime of the guard
class scoped_env {
public:
    scoped_env(std::string name, const std::string& value) : name_(std::move(name)) {
        ::setenv(name_.c_str(), value.c_str(), 1);
    }

    ~scoped_env() { ::unsetenv(name_.c_str()); }

    scoped_env(const scoped_env&) = delete;
    auto operator=(const scoped_env&) -> scoped_env& = delete;

private:
    std::string name_;
};

}  // namespace

TEST_CASE("Empty configuration keeps defaults", "[config]") {
    auto result = config_loader::parse("{}");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    CHECK(config.pipeline.max_upload_bytes == 15u * 1024 * 1024);
    CHECK(config.pipeline.ocr_timeout == std::chrono::milliseconds(30000));
    CHECK(config.pipeline.use_worker_pool);
    CHECK(config.pipeline.max_parallel_runs == 0);
    CHECK(config.pipeline.finished_run_history == 256);
    CHECK(config.packager.target_bytes == 300u * 1024);
    CHECK(config.packager.initial_quality == 85);
    CHECK(config.packager.max_attempts == 5);
    CHECK_THAT(config.resolver.high_threshold, WithinAbs(0.40, 1e-9));
    CHECK_THAT(config.resolver.medium_threshold, WithinAbs(0.25, 1e-9));
    CHECK_THAT(config.resolver.low_threshold, WithinAbs(0.15, 1e-9));
    CHECK(config.storage.database_path == "sgkdoc.db");
    CHECK(config.logging.min_level == integration::log_level::info);
}

TEST_CASE("Configuration sections are read", "[config]") {
    auto result = config_loader::parse(R"({
        "logging":   { "level": "debug", "directory": "/var/log/sgkdoc", "console": false },
        "pipeline":  { "max_upload_mb": 20, "ocr_timeout_ms": 5000, "workers": 2,
                       "update_workflow": false, "max_parallel_runs": 3,
                       "finished_run_history": 16 },
        "rectifier": { "max_analysis_dimension": 800, "fallback_margin": 0.1 },
        "packager":  { "target_kb": 200, "initial_quality": 80, "max_attempts": 3 },
        "resolver":  { "high": 0.5, "medium": 0.3, "low": 0.2 },
        "storage":   { "database": "/data/sgk.db", "quota_mb": 64, "wal": false },
        "unknown":   { "ignored": true }
    })");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    CHECK(config.logging.min_level == integration::log_level::debug);
    CHECK(config.logging.log_directory == std::filesystem::path("/var/log/sgkdoc"));
    CHECK_FALSE(config.logging.enable_console);
    CHECK(config.pipeline.max_upload_bytes == 20u * 1024 * 1024);
    CHECK(config.pipeline.ocr_timeout == std::chrono::milliseconds(5000));
    CHECK_FALSE(config.pipeline.update_workflow);
    CHECK(config.pipeline.max_parallel_runs == 3);
    CHECK(config.pipeline.finished_run_history == 16);
    CHECK(config.workers.worker_count == 2);
    CHECK(config.rectifier.max_analysis_dimension == 800);
    CHECK_THAT(config.rectifier.fallback_margin_fraction, WithinAbs(0.1, 1e-9));
    CHECK(config.packager.target_bytes == 200u * 1024);
    CHECK(config.packager.initial_quality == 80);
    CHECK(config.packager.max_attempts == 3);
    CHECK_THAT(config.resolver.high_threshold, WithinAbs(0.5, 1e-9));
    CHECK(config.storage.database_path == "/data/sgk.db");
    CHECK(config.storage.database.quota_bytes == 64u * 1024 * 1024);
    CHECK_FALSE(config.storage.database.wal_mode);
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
    SECTION("malformed JSON") {
        auto result = config_loader::parse("{ \"pipeline\": ");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_parse_error);
    }

    SECTION("root is not an object") {
        auto result = config_loader::parse("[1, 2]");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_parse_error);
    }

    SECTION("section is not an object") {
        auto result = config_loader::parse(R"({ "packager": 300 })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("wrong value type") {
        auto result = config_loader::parse(R"({ "pipeline": { "update_workflow": "yes" } })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("zero where a positive value is required") {
        auto result = config_loader::parse(R"({ "packager": { "max_attempts": 0 } })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("JPEG quality above 100") {
        auto result = config_loader::parse(R"({ "packager": { "initial_quality": 120 } })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("fraction out of range") {
        auto result = config_loader::parse(R"({ "rectifier": { "fallback_margin": 1.5 } })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }

    SECTION("thresholds out of order") {
        auto result = config_loader::parse(R"({ "resolver": { "medium": 0.5 } })");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
    }
}

TEST_CASE("Configuration file loading", "[config][file]") {
    const auto path = std::filesystem::temp_directory_path() / "sgkdoc_config_test.json";

    SECTION("existing file") {
        {
            std::ofstream out(path);
            out << R"({ "storage": { "database": "from_file.db" } })";
        }
        auto result = config_loader::load_file(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        CHECK(result.value().storage.database_path == "from_file.db");
    }

    SECTION("missing file") {
        std::filesystem::remove(path);
        auto result = config_loader::load_file(path);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_file_not_found);
    }
}

TEST_CASE("Environment overrides", "[config][env]") {
    app_config config;

    SECTION("values are applied") {
        scoped_env db("SGKDOC_TEST_DB_PATH", "/tmp/env.db");
        scoped_env level("SGKDOC_TEST_LOG_LEVEL", "error");
        scoped_env timeout("SGKDOC_TEST_OCR_TIMEOUT_MS", "1500");
        scoped_env target("SGKDOC_TEST_TARGET_KB", "250");

        REQUIRE(config_loader::apply_environment(config, "SGKDOC_TEST_").is_ok());
        CHECK(config.storage.database_path == "/tmp/env.db");
        CHECK(config.logging.min_level == integration::log_level::error);
        CHECK(config.pipeline.ocr_timeout == std::chrono::milliseconds(1500));
        CHECK(config.packager.target_bytes == 250u * 1024);
        CHECK(config.pipeline.max_upload_bytes == 15u * 1024 * 1024);
    }

    SECTION("non-numeric value is rejected") {
        scoped_env workers("SGKDOC_TEST_WORKERS", "four");

        auto result = config_loader::apply_environment(config, "SGKDOC_TEST_");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_invalid_value);
        CHECK(config.workers.worker_count == 4);
    }

    SECTION("unset variables change nothing") {
        REQUIRE(config_loader::apply_environment(config, "SGKDOC_UNSET_").is_ok());
        CHECK(config.storage.database_path == "sgkdoc.db");
    }
}
