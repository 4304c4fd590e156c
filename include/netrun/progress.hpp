#pragma once

// progress.hpp - progress events and the queue that carries them to a renderer

#include "aggregator.hpp"
#include "device.hpp"
#include "session_machine.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace netrun
{

    // ============================================================================
    // events
    // ============================================================================

    enum class progress_kind : std::uint8_t
    {
        run_started,
        device_completed,
        batch_completed,
        run_finished,
    };

    struct progress_event
    {
        progress_kind kind{progress_kind::run_started};
        std::size_t devices_completed{0};
        std::size_t devices_total{0};
        std::size_t batch{0}; // 1-based, 0 outside of any batch
        std::size_t batch_count{0};
        run_counters counters{};
        std::optional<device> target{};                       // device_completed only
        session_state terminal{session_state::terminal_success}; // device_completed only
        std::chrono::milliseconds elapsed{0};                 // device_completed only

        [[nodiscard]] auto percent() const noexcept -> double
        {
            if (devices_total == 0)
            {
                return 100.0;
            }
            return 100.0 * static_cast<double>(devices_completed) / static_cast<double>(devices_total);
        }
    };

    // ============================================================================
    // event queue - many producers, one consumer, closable
    // ============================================================================

    template <typename T>
    class event_queue
    {
    private:
        mutable std::mutex mutex_{};
        std::condition_variable cv_{};
        std::deque<T> items_{};
        bool closed_{false};

    public:
        event_queue() = default;

        event_queue(event_queue const &) = delete;
        auto operator=(event_queue const &) -> event_queue & = delete;
        event_queue(event_queue &&) = delete;
        auto operator=(event_queue &&) -> event_queue & = delete;
        ~event_queue() = default;

        // false once the queue is closed; the item is dropped
        auto push(T item) -> bool
        {
            {
                std::lock_guard lock{mutex_};
                if (closed_)
                {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        // blocks until an item arrives; nullopt once closed and drained
        [[nodiscard]] auto pop() -> std::optional<T>
        {
            std::unique_lock lock{mutex_};
            cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
            return take(lock);
        }

        [[nodiscard]] auto try_pop() -> std::optional<T>
        {
            std::unique_lock lock{mutex_};
            return take(lock);
        }

        auto close() -> void
        {
            {
                std::lock_guard lock{mutex_};
                closed_ = true;
            }
            cv_.notify_all();
        }

        [[nodiscard]] auto closed() const -> bool
        {
            std::lock_guard lock{mutex_};
            return closed_;
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            std::lock_guard lock{mutex_};
            return items_.size();
        }

    private:
        [[nodiscard]] auto take(std::unique_lock<std::mutex> const &) -> std::optional<T>
        {
            if (items_.empty())
            {
                return std::nullopt;
            }
            auto item = std::move(items_.front());
            items_.pop_front();
            return item;
        }
    };

    using progress_queue = event_queue<progress_event>;

} // namespace netrun
