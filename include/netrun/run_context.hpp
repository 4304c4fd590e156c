#pragma once

// run_context.hpp - run configuration plus the pause/cancel control plane
// owned by the run, handed to every worker by reference

#include "common.hpp"
#include "device.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace netrun
{

    // ============================================================================
    // run configuration
    // ============================================================================

    namespace limits
    {
        inline constexpr std::size_t min_workers = 1;
        inline constexpr std::size_t max_workers = 50;
        inline constexpr std::size_t min_batch_size = 1;
        inline constexpr std::size_t max_batch_size = 100;
    } // namespace limits

    struct run_config
    {
        std::size_t max_workers{10};
        std::size_t batch_size{5};
        std::chrono::seconds connect_timeout{30};
        std::chrono::seconds command_timeout{120};
        std::size_t retry_count{2};
        std::chrono::milliseconds retry_delay{1000};
        execution_mode mode{execution_mode::normal};

        // errors: invalid_config
        [[nodiscard]] auto validate() const -> void_result;

        // never more sessions than either a worker or a batch slot allows
        [[nodiscard]] auto effective_concurrency() const noexcept -> std::size_t
        {
            return max_workers < batch_size ? max_workers : batch_size;
        }
    };

    // ============================================================================
    // run context - read-mostly config plus atomic signals
    // ============================================================================

    class run_context
    {
    private:
        run_config config_;
        std::atomic<bool> paused_{false};
        std::atomic<bool> cancelled_{false};

        // only used to park the scheduler and to cut sleeps short
        mutable std::mutex mutex_{};
        mutable std::condition_variable cv_{};

    public:
        explicit run_context(run_config config) noexcept;

        run_context(run_context const &) = delete;
        auto operator=(run_context const &) -> run_context & = delete;
        run_context(run_context &&) = delete;
        auto operator=(run_context &&) -> run_context & = delete;
        ~run_context() = default;

        [[nodiscard]] auto config() const noexcept -> run_config const & { return config_; }

        // -------------------------------------------------------------------------
        // control plane - callable from any thread, including signal watchers
        // -------------------------------------------------------------------------

        auto pause() noexcept -> void;
        auto resume() noexcept -> void;
        auto cancel() noexcept -> void;

        [[nodiscard]] auto is_paused() const noexcept -> bool { return paused_.load(std::memory_order_acquire); }
        [[nodiscard]] auto is_cancelled() const noexcept -> bool { return cancelled_.load(std::memory_order_acquire); }

        // -------------------------------------------------------------------------
        // worker side
        // -------------------------------------------------------------------------

        // parks while paused; returns false when the run was cancelled instead of resumed
        [[nodiscard]] auto wait_while_paused() const -> bool;

        // sleeps up to `duration`; returns false when cancelled during the sleep
        [[nodiscard]] auto sleep_for(std::chrono::milliseconds duration) const -> bool;

    private:
        auto notify() noexcept -> void;
    };

} // namespace netrun
