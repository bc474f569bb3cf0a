/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging facade and document audit trail
 */

#include <sgkdoc/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace sgkdoc::integration {

auto parse_log_level(std::string_view name) noexcept -> log_level {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return log_level::info;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Without a directory only the console writer is usable
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config_.enable_file) {
            auto log_path = config_.log_directory / "sgkdoc.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config_.max_file_size_mb * 1024 * 1024,
                config_.max_files));
        }

        logger_->start();

        if (config_.enable_audit_log) {
            audit_log_path_ = config_.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return initialized_ &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";
        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }
        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        std::tm tm_val{};
        localtime_r(&time_t_val, &tm_val);

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << std::put_time(&tm_val, "%z");
        return oss.str();
    }

    // Non-ASCII bytes pass through; audit values are UTF-8 Turkish text
    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Document Audit Trail
// =============================================================================

void logger_adapter::log_upload_rejected(const std::string& file_name,
                                         const std::string& reason) {
    warn("Upload rejected: file={} reason={}", file_name, reason);

    write_audit_log("UPLOAD_REJECTED", "failure",
                    {{"file_name", file_name}, {"reason", reason}});
}

void logger_adapter::log_identity_resolved(const std::string& run_id,
                                           const std::string& patient_id,
                                           const std::string& tier,
                                           double confidence) {
    info("Identity resolved: run={} patient={} tier={} confidence={:.3f}",
         run_id, patient_id.empty() ? "-" : patient_id, tier, confidence);

    write_audit_log("IDENTITY_RESOLVED", patient_id.empty() ? "failure" : "success",
                    {{"run_id", run_id},
                     {"patient_id", patient_id},
                     {"tier", tier},
                     {"confidence", sgkdoc::compat::format("{:.3f}", confidence)}});
}

void logger_adapter::log_document_persisted(const std::string& run_id,
                                            const std::string& artifact_id,
                                            const std::string& patient_id,
                                            const std::string& document_type,
                                            std::size_t size_bytes) {
    info("Document persisted: run={} artifact={} patient={} type={} size={}",
         run_id, artifact_id, patient_id.empty() ? "-" : patient_id,
         document_type, size_bytes);

    write_audit_log("DOCUMENT_PERSISTED", "success",
                    {{"run_id", run_id},
                     {"artifact_id", artifact_id},
                     {"patient_id", patient_id},
                     {"document_type", document_type},
                     {"size_bytes", std::to_string(size_bytes)}});
}

void logger_adapter::log_persist_failed(const std::string& run_id,
                                        const std::string& reason) {
    error("Document persist failed: run={} reason={}", run_id, reason);

    write_audit_log("DOCUMENT_PERSIST_FAILED", "failure",
                    {{"run_id", run_id}, {"reason", reason}});
}

void logger_adapter::log_manual_assignment(const std::string& artifact_id,
                                           const std::string& previous_patient_id,
                                           const std::string& patient_id) {
    info("Manual assignment: artifact={} {} -> {}",
         artifact_id, previous_patient_id.empty() ? "-" : previous_patient_id,
         patient_id);

    write_audit_log("MANUAL_ASSIGNMENT", "success",
                    {{"artifact_id", artifact_id},
                     {"previous_patient_id", previous_patient_id},
                     {"patient_id", patient_id}});
}

void logger_adapter::log_workflow_status_changed(const std::string& patient_id,
                                                 const std::string& status,
                                                 const std::string& note) {
    debug("Workflow status changed: patient={} status={}", patient_id, status);

    write_audit_log("WORKFLOW_STATUS_CHANGED", "success",
                    {{"patient_id", patient_id}, {"status", status}, {"note", note}});
}

void logger_adapter::write_audit_log(const std::string& event_type,
                                     const std::string& outcome,
                                     const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

}  // namespace sgkdoc::integration
