/**
 * @file ilogger.hpp
 * @brief Logger interface injected into pipeline components
 *
 * Components take a std::shared_ptr<ILogger> at construction. A nullptr
 * argument falls back to null_logger(), so tests can build components
 * without initializing logger_system.
 */

#pragma once

#include <sgkdoc/integration/logger_adapter.hpp>
#include <sgkdoc/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace sgkdoc::di {

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Thread Safety: implementations must accept calls from concurrent runs.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void debug(std::string_view message) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void error(std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    template <typename... Args>
    void debug_fmt(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(sgkdoc::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(sgkdoc::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
};

/**
 * @brief Discards every message
 */
class NullLogger final : public ILogger {
public:
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief Forwards to integration::logger_adapter with a component prefix
 */
class LoggerService final : public ILogger {
public:
    explicit LoggerService(std::string component = {})
        : prefix_(component.empty() ? std::string{} : "[" + component + "] ") {}

    void debug(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::debug, prefix_ + std::string{message});
    }

    void info(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::info, prefix_ + std::string{message});
    }

    void warn(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::warn, prefix_ + std::string{message});
    }

    void error(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::error, prefix_ + std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    std::string prefix_;
};

[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace sgkdoc::di
