/**
 * @file thread_adapter.hpp
 * @brief Shared thread_system pool for collaborator calls
 *
 * Calls into external collaborators (OCR, delegated classification) are
 * submitted here so that the pipeline can await them with a timeout. A
 * collaborator that overruns keeps its worker busy; the run that gave up on
 * it continues without blocking.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace sgkdoc::integration {

/**
 * @brief Configuration options for the collaborator pool
 */
struct worker_pool_config {
    /// Number of worker threads started with the pool
    std::size_t worker_count = 4;

    /// Pool name for logging
    std::string pool_name = "sgkdoc_collaborator_pool";
};

/**
 * @class thread_adapter
 * @brief Static facade over a kcenon::thread::thread_pool
 *
 * The pool is started lazily on first submission.
 *
 * Thread Safety: all public methods are thread-safe.
 *
 * @example
 * @code
 * auto future = thread_adapter::submit([service, bytes]() {
 *     return service->extract_text(bytes);
 * });
 * if (future.wait_for(std::chrono::seconds(30)) != std::future_status::ready) {
 *     // timed out
 * }
 * @endcode
 */
class thread_adapter {
public:
    static void configure(const worker_pool_config& config);

    [[nodiscard]] static auto get_config() -> worker_pool_config;

    /**
     * @brief Start the pool; no-op when already running
     * @return true if the pool is running afterwards
     */
    [[nodiscard]] static auto start() -> bool;

    [[nodiscard]] static auto is_running() -> bool;

    /**
     * @brief Stop the pool
     * @param wait_for_completion If true, pending jobs are drained first
     */
    static void shutdown(bool wait_for_completion = true);

    /**
     * @brief Submit a task and get a future for its result
     *
     * @throws std::runtime_error if the pool cannot be started or refuses
     *         the job
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& task)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    [[nodiscard]] static auto get_thread_count() -> std::size_t;

private:
    static void submit_job_internal(std::function<void()> task);

    static std::shared_ptr<kcenon::thread::thread_pool> pool_;
    static worker_pool_config config_;
    static std::mutex mutex_;

    thread_adapter() = delete;
};

template <typename F>
auto thread_adapter::submit(F&& task)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto packaged_task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    auto future = packaged_task->get_future();

    submit_job_internal([packaged_task]() { (*packaged_task)(); });

    return future;
}

}  // namespace sgkdoc::integration
