#pragma once

// worker_pool.hpp - fixed set of worker threads draining a task queue
// the first task error is kept; the pool itself never decides what a task means

#include "common.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace netrun
{

    class worker_pool
    {
    public:
        using task = std::function<void_result()>;

    private:
        std::vector<std::thread> workers_{};

        std::mutex mutex_{};
        std::condition_variable cv_{};
        std::condition_variable cv_done_{};

        std::queue<task> queue_{};
        bool stopping_{false};

        std::atomic<std::size_t> active_{0};

        std::mutex error_mutex_{};
        std::optional<error> first_error_{};

    public:
        explicit worker_pool(std::size_t thread_count);
        ~worker_pool();

        worker_pool(worker_pool const &) = delete;
        auto operator=(worker_pool const &) -> worker_pool & = delete;
        worker_pool(worker_pool &&) = delete;
        auto operator=(worker_pool &&) -> worker_pool & = delete;

        // errors: internal_fault when the pool is stopping
        [[nodiscard]] auto submit(task t) -> void_result;

        // blocks until the queue is empty and no task is running; returns the first task error
        [[nodiscard]] auto wait() -> void_result;

        auto stop() noexcept -> void;

        [[nodiscard]] auto thread_count() const noexcept -> std::size_t { return workers_.size(); }
        [[nodiscard]] auto active() const noexcept -> std::size_t { return active_.load(std::memory_order_relaxed); }

    private:
        auto worker_loop() noexcept -> void;
        auto set_error(error err) noexcept -> void;
    };

} // namespace netrun
