// run_context.cpp - configuration validation and the pause/cancel signals

#include "netrun/run_context.hpp"

#include <spdlog/spdlog.h>

namespace netrun
{

    auto run_config::validate() const -> void_result
    {
        if (max_workers < limits::min_workers || max_workers > limits::max_workers)
        {
            return std::unexpected{make_error(error_code::invalid_config, "max workers {} outside [{}, {}]", max_workers,
                                              limits::min_workers, limits::max_workers)};
        }
        if (batch_size < limits::min_batch_size || batch_size > limits::max_batch_size)
        {
            return std::unexpected{make_error(error_code::invalid_config, "batch size {} outside [{}, {}]", batch_size,
                                              limits::min_batch_size, limits::max_batch_size)};
        }
        if (connect_timeout.count() <= 0)
        {
            return std::unexpected{make_error(error_code::invalid_config, "connect timeout must be positive")};
        }
        if (command_timeout.count() <= 0)
        {
            return std::unexpected{make_error(error_code::invalid_config, "command timeout must be positive")};
        }
        if (retry_delay.count() < 0)
        {
            return std::unexpected{make_error(error_code::invalid_config, "retry delay must not be negative")};
        }
        return {};
    }

    run_context::run_context(run_config config) noexcept : config_{std::move(config)}
    {
    }

    auto run_context::pause() noexcept -> void
    {
        if (!paused_.exchange(true, std::memory_order_acq_rel))
        {
            spdlog::info("run paused, in-flight devices keep going");
        }
        notify();
    }

    auto run_context::resume() noexcept -> void
    {
        if (paused_.exchange(false, std::memory_order_acq_rel))
        {
            spdlog::info("run resumed");
        }
        notify();
    }

    auto run_context::cancel() noexcept -> void
    {
        if (!cancelled_.exchange(true, std::memory_order_acq_rel))
        {
            spdlog::warn("run cancelled, no further devices will start");
        }
        notify();
    }

    auto run_context::wait_while_paused() const -> bool
    {
        std::unique_lock lock{mutex_};
        cv_.wait(lock, [this] { return !is_paused() || is_cancelled(); });
        return !is_cancelled();
    }

    auto run_context::sleep_for(std::chrono::milliseconds const duration) const -> bool
    {
        std::unique_lock lock{mutex_};
        cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
        return !is_cancelled();
    }

    auto run_context::notify() noexcept -> void
    {
        // taking the lock orders the flag store before a waiter's predicate check
        {
            std::lock_guard lock{mutex_};
        }
        cv_.notify_all();
    }

} // namespace netrun
