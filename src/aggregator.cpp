// aggregator.cpp - ordered result collection

#include "netrun/aggregator.hpp"

#include <spdlog/spdlog.h>

namespace netrun
{

    auto run_counters::add(command_status const status) noexcept -> void
    {
        switch (status)
        {
        case command_status::success:
            ++succeeded;
            break;
        case command_status::failure:
            ++failed;
            break;
        case command_status::skipped:
            ++skipped;
            break;
        case command_status::cancelled:
            ++cancelled;
            break;
        }
    }

    result_aggregator::result_aggregator(std::size_t const devices)
        : size_{devices}, slots_{std::make_unique<slot[]>(devices)}
    {
    }

    auto result_aggregator::record(unit_outcome outcome) -> void_result
    {
        if (outcome.index >= size_)
        {
            return std::unexpected{make_error(error_code::internal_fault, "slot {} out of range ({} devices)",
                                              outcome.index, size_)};
        }

        auto &s = slots_[outcome.index];
        if (s.claimed.exchange(true, std::memory_order_acq_rel))
        {
            return std::unexpected{make_error(error_code::internal_fault, "second result for slot {} ({})",
                                              outcome.index, outcome.target.label())};
        }

        run_counters delta;
        for (auto const &row : outcome.results)
        {
            delta.add(row.status);
        }

        s.value = std::move(outcome);
        s.ready.store(true, std::memory_order_release);

        succeeded_.fetch_add(delta.succeeded, std::memory_order_relaxed);
        failed_.fetch_add(delta.failed, std::memory_order_relaxed);
        skipped_.fetch_add(delta.skipped, std::memory_order_relaxed);
        cancelled_rows_.fetch_add(delta.cancelled, std::memory_order_relaxed);
        completed_.fetch_add(1, std::memory_order_acq_rel);
        return {};
    }

    auto result_aggregator::is_recorded(std::size_t const index) const noexcept -> bool
    {
        return index < size_ && slots_[index].ready.load(std::memory_order_acquire);
    }

    auto result_aggregator::counters() const noexcept -> run_counters
    {
        return run_counters{
            .succeeded = succeeded_.load(std::memory_order_relaxed),
            .failed = failed_.load(std::memory_order_relaxed),
            .skipped = skipped_.load(std::memory_order_relaxed),
            .cancelled = cancelled_rows_.load(std::memory_order_relaxed),
        };
    }

    auto result_aggregator::snapshot() const -> execution_report
    {
        execution_report report;
        report.devices_total = size_;
        report.cancelled = cancelled_.load(std::memory_order_acquire);
        report.entries.reserve(size_);

        for (std::size_t i = 0; i < size_; ++i)
        {
            // a ready slot is never written again, so reading it needs no lock
            if (!slots_[i].ready.load(std::memory_order_acquire))
            {
                continue;
            }

            auto const &entry = report.entries.emplace_back(slots_[i].value);
            for (auto const &row : entry.results)
            {
                report.counters.add(row.status);
                if (row.failure.has_value())
                {
                    ++report.failures_by_kind[static_cast<std::size_t>(*row.failure)];
                }
            }
        }
        return report;
    }

    auto result_aggregator::final_report() const -> result<execution_report>
    {
        auto report = snapshot();
        if (!report.complete())
        {
            for (std::size_t i = 0; i < size_; ++i)
            {
                if (!is_recorded(i))
                {
                    return std::unexpected{make_error(error_code::internal_fault,
                                                      "device {} of {} has no recorded result", i + 1, size_)};
                }
            }
        }
        spdlog::debug("report: {} device(s), {} row(s)", report.entries.size(), report.counters.total());
        return report;
    }

} // namespace netrun
