#pragma once

// aggregator.hpp - ordered result collection with lock-free snapshots
// one slot per device, reserved by list position; each slot is written exactly once

#include "common.hpp"
#include "device.hpp"
#include "session_machine.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace netrun
{

    // ============================================================================
    // counters - one count per session_result row
    // ============================================================================

    inline constexpr std::size_t failure_kind_count = 5;

    struct run_counters
    {
        std::size_t succeeded{0};
        std::size_t failed{0};
        std::size_t skipped{0};
        std::size_t cancelled{0};

        [[nodiscard]] auto total() const noexcept -> std::size_t { return succeeded + failed + skipped + cancelled; }

        auto add(command_status status) noexcept -> void;

        [[nodiscard]] auto operator==(run_counters const &) const -> bool = default;
    };

    struct execution_report
    {
        std::vector<unit_outcome> entries{}; // device-list order
        run_counters counters{};
        std::array<std::size_t, failure_kind_count> failures_by_kind{};
        std::size_t devices_total{0};
        bool cancelled{false};

        [[nodiscard]] auto failures_of(failure_kind const kind) const noexcept -> std::size_t
        {
            return failures_by_kind[static_cast<std::size_t>(kind)];
        }

        [[nodiscard]] auto complete() const noexcept -> bool { return entries.size() == devices_total; }

        [[nodiscard]] auto all_succeeded() const noexcept -> bool
        {
            return complete() && !cancelled && counters.succeeded == counters.total();
        }
    };

    // ============================================================================
    // result aggregator
    // ============================================================================

    class result_aggregator
    {
    private:
        struct slot
        {
            std::atomic<bool> claimed{false};
            std::atomic<bool> ready{false};
            unit_outcome value{};
        };

        std::size_t size_;
        std::unique_ptr<slot[]> slots_;

        std::atomic<std::size_t> completed_{0};
        std::atomic<std::size_t> succeeded_{0};
        std::atomic<std::size_t> failed_{0};
        std::atomic<std::size_t> skipped_{0};
        std::atomic<std::size_t> cancelled_rows_{0};
        std::atomic<bool> cancelled_{false};

    public:
        explicit result_aggregator(std::size_t devices);

        result_aggregator(result_aggregator const &) = delete;
        auto operator=(result_aggregator const &) -> result_aggregator & = delete;
        result_aggregator(result_aggregator &&) = delete;
        auto operator=(result_aggregator &&) -> result_aggregator & = delete;
        ~result_aggregator() = default;

        // errors: internal_fault on an out-of-range index or a second write to the same slot
        [[nodiscard]] auto record(unit_outcome outcome) -> void_result;

        auto mark_cancelled() noexcept -> void { cancelled_.store(true, std::memory_order_release); }

        [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

        [[nodiscard]] auto completed() const noexcept -> std::size_t
        {
            return completed_.load(std::memory_order_acquire);
        }

        [[nodiscard]] auto is_recorded(std::size_t index) const noexcept -> bool;

        // running totals; may be mid-update relative to each other
        [[nodiscard]] auto counters() const noexcept -> run_counters;

        // copies every recorded slot; counters are derived from the copy
        [[nodiscard]] auto snapshot() const -> execution_report;

        // errors: internal_fault when a slot was never recorded
        [[nodiscard]] auto final_report() const -> result<execution_report>;
    };

} // namespace netrun
