/**
 * @file config_loader.hpp
 * @brief JSON configuration file and environment overrides
 *
 * @code{.json}
 * {
 *   "logging":   { "level": "info", "directory": "logs", "console": true,
 *                  "file": true, "audit": true, "async": true },
 *   "pipeline":  { "max_upload_mb": 15, "ocr_timeout_ms": 30000,
 *                  "workers": 4, "update_workflow": true },
 *   "rectifier": { "max_analysis_dimension": 1200, "fallback_margin": 0.05 },
 *   "packager":  { "target_kb": 300, "initial_quality": 85, "max_attempts": 5 },
 *   "resolver":  { "high": 0.40, "medium": 0.25, "low": 0.15 },
 *   "storage":   { "database": "sgkdoc.db", "quota_mb": 512 }
 * }
 * @endcode
 *
 * Missing sections and keys keep their defaults; unknown keys are ignored.
 */

#ifndef SGKDOC_CONFIG_CONFIG_LOADER_HPP
#define SGKDOC_CONFIG_CONFIG_LOADER_HPP

#include "sgkdoc/geometry/geometry_rectifier.hpp"
#include "sgkdoc/integration/logger_adapter.hpp"
#include "sgkdoc/integration/thread_adapter.hpp"
#include "sgkdoc/matching/identity_resolver.hpp"
#include "sgkdoc/packaging/document_packager.hpp"
#include "sgkdoc/pipeline/pipeline_config.hpp"
#include <sgkdoc/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace sgkdoc::config {

/**
 * @brief Complete configuration of the library and the CLI
 */
struct app_config {
    integration::logger_config logging;
    integration::worker_pool_config workers;
    pipeline::pipeline_config pipeline;
    geometry::rectifier_config rectifier;
    packaging::packager_config packager;
    matching::resolver_config resolver;
    pipeline::storage_config storage;
};

/**
 * @class config_loader
 * @brief Builds app_config from JSON and environment variables
 */
class config_loader {
public:
    /**
     * @return config_file_not_found, config_parse_error for malformed JSON,
     *         config_invalid_value for a key of the wrong type or range
     */
    [[nodiscard]] static auto load_file(const std::filesystem::path& path)
        -> Result<app_config>;

    [[nodiscard]] static auto parse(std::string_view json_text) -> Result<app_config>;

    /**
     * @brief Overrides selected keys from the environment
     *
     * | Variable                   | Key                         |
     * |----------------------------|-----------------------------|
     * | <prefix>LOG_LEVEL          | logging.level               |
     * | <prefix>LOG_DIR            | logging.directory           |
     * | <prefix>DB_PATH            | storage.database            |
     * | <prefix>STORAGE_QUOTA_MB   | storage.quota_mb            |
     * | <prefix>OCR_TIMEOUT_MS     | pipeline.ocr_timeout_ms     |
     * | <prefix>MAX_UPLOAD_MB      | pipeline.max_upload_mb      |
     * | <prefix>WORKERS            | pipeline.workers            |
     * | <prefix>TARGET_KB          | packager.target_kb          |
     */
    [[nodiscard]] static auto apply_environment(app_config& config,
                                                std::string_view prefix = "SGKDOC_")
        -> VoidResult;
};

}  // namespace sgkdoc::config

#endif  // SGKDOC_CONFIG_CONFIG_LOADER_HPP
