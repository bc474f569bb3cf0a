/**
 * @file logger_adapter.hpp
 * @brief Adapter for logger_system with a document audit trail
 *
 * Routes pipeline logging to kcenon::logger (console and rotating file
 * writers) and appends audit events (document persisted, identity resolved,
 * manual assignment, workflow change) as JSON lines to audit.json.
 */

#pragma once

#include <sgkdoc/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace sgkdoc::integration {

/**
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Configuration for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate audit trail file
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @brief Parse a level name ("trace", "debug", ...); unknown names map to info
 */
[[nodiscard]] auto parse_log_level(std::string_view name) noexcept -> log_level;

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Logging calls made before initialize() (or after shutdown()) are dropped.
 *
 * Thread Safety: all methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/sgkdoc";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Run {} started for {}", run_id, file_name);
 * logger_adapter::log_document_persisted(run_id, artifact_id, patient_id,
 *                                        "recete", 184320);
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Document audit trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a rejected upload
     * @param file_name Name of the uploaded file
     * @param reason User-facing rejection message
     */
    static void log_upload_rejected(const std::string& file_name,
                                    const std::string& reason);

    /**
     * @brief Record the identity resolution verdict of a run
     */
    static void log_identity_resolved(const std::string& run_id,
                                      const std::string& patient_id,
                                      const std::string& tier,
                                      double confidence);

    /**
     * @brief Record a committed document artifact
     */
    static void log_document_persisted(const std::string& run_id,
                                       const std::string& artifact_id,
                                       const std::string& patient_id,
                                       const std::string& document_type,
                                       std::size_t size_bytes);

    /**
     * @brief Record a failed commit (the packaged bytes are retained)
     */
    static void log_persist_failed(const std::string& run_id,
                                   const std::string& reason);

    /**
     * @brief Record a manual patient assignment
     */
    static void log_manual_assignment(const std::string& artifact_id,
                                      const std::string& previous_patient_id,
                                      const std::string& patient_id);

    /**
     * @brief Record a patient workflow status change
     */
    static void log_workflow_status_changed(const std::string& patient_id,
                                            const std::string& status,
                                            const std::string& note);

    /**
     * @brief Write a raw audit entry
     * @param event_type Event name (e.g. "DOCUMENT_PERSISTED")
     * @param outcome "success" or "failure"
     * @param fields Additional string fields
     */
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace sgkdoc::integration
