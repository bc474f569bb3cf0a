/**
 * @file thread_adapter.cpp
 * @brief Implementation of the collaborator pool over thread_system
 */

#include <sgkdoc/integration/thread_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>

#include <stdexcept>

namespace sgkdoc::integration {

std::shared_ptr<kcenon::thread::thread_pool> thread_adapter::pool_ = nullptr;
worker_pool_config thread_adapter::config_;
std::mutex thread_adapter::mutex_;

namespace {

auto start_locked(std::shared_ptr<kcenon::thread::thread_pool>& pool,
                  const worker_pool_config& config) -> bool {
    if (pool && pool->is_running()) {
        return true;
    }

    pool = std::make_shared<kcenon::thread::thread_pool>(config.pool_name);

    for (std::size_t i = 0; i < config.worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto result = pool->enqueue(std::move(worker));
        if (!result) {
            pool.reset();
            return false;
        }
    }

    auto start_result = pool->start();
    if (!start_result) {
        pool.reset();
        return false;
    }
    return true;
}

}  // namespace

void thread_adapter::configure(const worker_pool_config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

auto thread_adapter::get_config() -> worker_pool_config {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

auto thread_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked(pool_, config_);
}

auto thread_adapter::is_running() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        pool_->stop(!wait_for_completion);
        pool_.reset();
    }
}

void thread_adapter::submit_job_internal(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!start_locked(pool_, config_)) {
        throw std::runtime_error("Failed to start collaborator thread pool");
    }
    if (!pool_->submit_task(std::move(task))) {
        throw std::runtime_error("Failed to submit task to collaborator thread pool");
    }
}

auto thread_adapter::get_thread_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_thread_count() : 0;
}

}  // namespace sgkdoc::integration
