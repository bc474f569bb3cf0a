/**
 * @file config_loader.cpp
 * @brief JSON configuration parsing (nlohmann/json)
 */

#include "sgkdoc/config/config_loader.hpp"

#include <sgkdoc/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace sgkdoc::config {

namespace {

using json = nlohmann::json;

/**
 * @brief Thrown while reading a section; converted to config_invalid_value
 */
class invalid_value : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename T>
void read(const json& section, const char* section_name, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw invalid_value(sgkdoc::compat::format("{}.{}: {}", section_name, key, e.what()));
    }
}

template <typename T>
void read_positive(const json& section, const char* section_name, const char* key, T& target) {
    T value = target;
    read(section, section_name, key, value);
    if (value <= T{0}) {
        throw invalid_value(sgkdoc::compat::format("{}.{} must be positive", section_name, key));
    }
    target = value;
}

void read_fraction(const json& section, const char* section_name, const char* key,
                   double& target) {
    double value = target;
    read(section, section_name, key, value);
    if (value < 0.0 || value > 1.0) {
        throw invalid_value(
            sgkdoc::compat::format("{}.{} must lie in [0, 1]", section_name, key));
    }
    target = value;
}

auto section_of(const json& root, const char* name) -> const json* {
    auto it = root.find(name);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw invalid_value(sgkdoc::compat::format("section '{}' must be an object", name));
    }
    return &*it;
}

void read_logging(const json& root, integration::logger_config& logging) {
    const auto* s = section_of(root, "logging");
    if (!s) {
        return;
    }

    std::string level;
    read(*s, "logging", "level", level);
    if (!level.empty()) {
        logging.min_level = integration::parse_log_level(level);
    }

    std::string directory;
    read(*s, "logging", "directory", directory);
    if (!directory.empty()) {
        logging.log_directory = directory;
    }

    read(*s, "logging", "console", logging.enable_console);
    read(*s, "logging", "file", logging.enable_file);
    read(*s, "logging", "audit", logging.enable_audit_log);
    read(*s, "logging", "async", logging.async_mode);
    read_positive(*s, "logging", "max_file_size_mb", logging.max_file_size_mb);
    read_positive(*s, "logging", "max_files", logging.max_files);
}

void read_pipeline(const json& root, app_config& config) {
    const auto* s = section_of(root, "pipeline");
    if (!s) {
        return;
    }

    std::size_t upload_mb = config.pipeline.max_upload_bytes / (1024 * 1024);
    read_positive(*s, "pipeline", "max_upload_mb", upload_mb);
    config.pipeline.max_upload_bytes = upload_mb * 1024 * 1024;

    auto timeout_ms = static_cast<int64_t>(config.pipeline.ocr_timeout.count());
    read_positive(*s, "pipeline", "ocr_timeout_ms", timeout_ms);
    config.pipeline.ocr_timeout = std::chrono::milliseconds(timeout_ms);

    read(*s, "pipeline", "allowed_media_types", config.pipeline.allowed_media_types);
    read(*s, "pipeline", "use_worker_pool", config.pipeline.use_worker_pool);
    read(*s, "pipeline", "update_workflow", config.pipeline.update_workflow);
    read(*s, "pipeline", "max_parallel_runs", config.pipeline.max_parallel_runs);
    read(*s, "pipeline", "finished_run_history", config.pipeline.finished_run_history);
    read_positive(*s, "pipeline", "workers", config.workers.worker_count);
}

void read_rectifier(const json& root, geometry::rectifier_config& rectifier) {
    const auto* s = section_of(root, "rectifier");
    if (!s) {
        return;
    }
    read_positive(*s, "rectifier", "max_analysis_dimension", rectifier.max_analysis_dimension);
    read_fraction(*s, "rectifier", "fallback_margin", rectifier.fallback_margin_fraction);
    read_fraction(*s, "rectifier", "min_candidate_score", rectifier.min_candidate_score);
    read_fraction(*s, "rectifier", "min_area_ratio", rectifier.min_area_ratio);
    read_fraction(*s, "rectifier", "max_area_ratio", rectifier.max_area_ratio);
    read_positive(*s, "rectifier", "min_aspect_ratio", rectifier.min_aspect_ratio);
    read_positive(*s, "rectifier", "max_aspect_ratio", rectifier.max_aspect_ratio);
}

void read_packager(const json& root, packaging::packager_config& packager) {
    const auto* s = section_of(root, "packager");
    if (!s) {
        return;
    }

    std::size_t target_kb = packager.target_bytes / 1024;
    read_positive(*s, "packager", "target_kb", target_kb);
    packager.target_bytes = target_kb * 1024;

    read_positive(*s, "packager", "initial_quality", packager.initial_quality);
    read_positive(*s, "packager", "initial_max_side", packager.initial_max_side);
    read_fraction(*s, "packager", "loop_start_quality", packager.loop_start_quality);
    read_positive(*s, "packager", "loop_max_width", packager.loop_max_width);
    read_fraction(*s, "packager", "quality_factor", packager.quality_factor);
    read_fraction(*s, "packager", "dimension_factor", packager.dimension_factor);
    read_positive(*s, "packager", "max_attempts", packager.max_attempts);
    read_positive(*s, "packager", "preview_max_side", packager.preview_max_side);

    if (packager.initial_quality > 100) {
        throw invalid_value("packager.initial_quality must not exceed 100");
    }
}

void read_resolver(const json& root, matching::resolver_config& resolver) {
    const auto* s = section_of(root, "resolver");
    if (!s) {
        return;
    }
    read_fraction(*s, "resolver", "high", resolver.high_threshold);
    read_fraction(*s, "resolver", "medium", resolver.medium_threshold);
    read_fraction(*s, "resolver", "low", resolver.low_threshold);
    read_positive(*s, "resolver", "max_candidates", resolver.max_candidates);

    if (!(resolver.high_threshold >= resolver.medium_threshold &&
          resolver.medium_threshold >= resolver.low_threshold)) {
        throw invalid_value("resolver thresholds must satisfy high >= medium >= low");
    }
}

void read_storage(const json& root, pipeline::storage_config& storage) {
    const auto* s = section_of(root, "storage");
    if (!s) {
        return;
    }
    read(*s, "storage", "database", storage.database_path);

    std::size_t quota_mb = storage.database.quota_bytes / (1024 * 1024);
    read(*s, "storage", "quota_mb", quota_mb);
    storage.database.quota_bytes = quota_mb * 1024 * 1024;

    read(*s, "storage", "wal", storage.database.wal_mode);
}

auto env_value(std::string_view prefix, const char* name) -> std::optional<std::string> {
    const auto variable = std::string(prefix) + name;
    const char* value = std::getenv(variable.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto parse_unsigned(const std::string& text, const std::string& variable)
    -> Result<std::size_t> {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return sgkdoc_error<std::size_t>(
            error_codes::config_invalid_value,
            sgkdoc::compat::format("{} must be a positive integer", variable), text);
    }
    return value;
}

}  // namespace

auto config_loader::load_file(const std::filesystem::path& path) -> Result<app_config> {
    std::ifstream file(path);
    if (!file) {
        return sgkdoc_error<app_config>(
            error_codes::config_file_not_found,
            sgkdoc::compat::format("Configuration file not found: {}", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

auto config_loader::parse(std::string_view json_text) -> Result<app_config> {
    json root;
    try {
        root = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
        return sgkdoc_error<app_config>(error_codes::config_parse_error,
                                        "Malformed configuration", e.what());
    }

    if (!root.is_object()) {
        return sgkdoc_error<app_config>(error_codes::config_parse_error,
                                        "Configuration root must be an object");
    }

    app_config config;
    try {
        read_logging(root, config.logging);
        read_pipeline(root, config);
        read_rectifier(root, config.rectifier);
        read_packager(root, config.packager);
        read_resolver(root, config.resolver);
        read_storage(root, config.storage);
    } catch (const invalid_value& e) {
        return sgkdoc_error<app_config>(error_codes::config_invalid_value,
                                        "Invalid configuration value", e.what());
    }
    return config;
}

auto config_loader::apply_environment(app_config& config, std::string_view prefix)
    -> VoidResult {
    if (auto level = env_value(prefix, "LOG_LEVEL")) {
        config.logging.min_level = integration::parse_log_level(*level);
    }
    if (auto dir = env_value(prefix, "LOG_DIR")) {
        config.logging.log_directory = *dir;
    }
    if (auto db = env_value(prefix, "DB_PATH")) {
        config.storage.database_path = *db;
    }

    struct numeric_override {
        const char* name;
        std::function<void(std::size_t)> apply;
    };
    const numeric_override overrides[] = {
        {"STORAGE_QUOTA_MB",
         [&](std::size_t v) { config.storage.database.quota_bytes = v * 1024 * 1024; }},
        {"OCR_TIMEOUT_MS",
         [&](std::size_t v) {
             config.pipeline.ocr_timeout = std::chrono::milliseconds(static_cast<int64_t>(v));
         }},
        {"MAX_UPLOAD_MB",
         [&](std::size_t v) { config.pipeline.max_upload_bytes = v * 1024 * 1024; }},
        {"WORKERS", [&](std::size_t v) { config.workers.worker_count = v; }},
        {"TARGET_KB", [&](std::size_t v) { config.packager.target_bytes = v * 1024; }},
    };

    for (const auto& entry : overrides) {
        auto text = env_value(prefix, entry.name);
        if (!text) {
            continue;
        }
        auto value = parse_unsigned(*text, std::string(prefix) + entry.name);
        if (value.is_err()) {
            return VoidResult(value.error());
        }
        entry.apply(value.value());
    }
    return ok();
}

}  // namespace sgkdoc::config
