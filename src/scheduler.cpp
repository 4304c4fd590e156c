// scheduler.cpp - batch dispatch, pause gating and cancellation sweep

#include "netrun/scheduler.hpp"

#include "netrun/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <semaphore>

namespace netrun
{

    namespace
    {

        using session_slots = std::counting_semaphore<static_cast<std::ptrdiff_t>(limits::max_workers)>;

        // returns the slot even when the task unwinds
        class slot_guard
        {
        private:
            session_slots &slots_;

        public:
            explicit slot_guard(session_slots &slots) noexcept : slots_{slots} {}
            ~slot_guard() { slots_.release(); }

            slot_guard(slot_guard const &) = delete;
            auto operator=(slot_guard const &) -> slot_guard & = delete;
            slot_guard(slot_guard &&) = delete;
            auto operator=(slot_guard &&) -> slot_guard & = delete;
        };

        // pause is checked again once the wait for a free slot ends
        [[nodiscard]] auto claim_slot(session_slots &slots, run_context const &ctx) -> bool
        {
            while (ctx.wait_while_paused())
            {
                slots.acquire();
                if (ctx.is_cancelled())
                {
                    slots.release();
                    return false;
                }
                if (!ctx.is_paused())
                {
                    return true;
                }
                slots.release();
            }
            return false;
        }

    } // namespace

    batch_scheduler::batch_scheduler(transport &link, run_context const &ctx, scheduler_options options)
        : link_{link}, ctx_{ctx}, options_{std::move(options)}
    {
    }

    auto batch_scheduler::emit(progress_event event) const -> void
    {
        if (options_.progress != nullptr)
        {
            static_cast<void>(options_.progress->push(std::move(event)));
        }
    }

    auto batch_scheduler::run(std::vector<execution_unit> const &units) -> result<execution_report>
    {
        auto const &cfg = ctx_.config();
        if (auto valid = cfg.validate(); !valid.has_value())
        {
            return std::unexpected{valid.error()};
        }
        for (auto const &unit : units)
        {
            if (unit.commands.mode != cfg.mode)
            {
                return std::unexpected{make_error(error_code::invalid_config, "device {}: mode {} differs from run mode {}",
                                                  unit.target.address, unit.commands.mode, cfg.mode)};
            }
        }

        auto const total = units.size();
        auto const batch_size = cfg.batch_size;
        auto const batch_count = (total + batch_size - 1) / batch_size;
        auto const concurrency = cfg.effective_concurrency();

        result_aggregator aggregator{total};
        session_machine machine{link_, ctx_, options_.clock};
        machine.set_observer(options_.observer);
        session_slots slots{static_cast<std::ptrdiff_t>(concurrency)};

        // declared last so its threads are joined before anything they reference goes away
        worker_pool pool{concurrency};

        spdlog::info("run: {} device(s), {} batch(es) of up to {}, {} concurrent session(s), mode {}", total,
                     batch_count, batch_size, concurrency, cfg.mode);
        emit(progress_event{.kind = progress_kind::run_started, .devices_total = total, .batch_count = batch_count});

        std::size_t dispatched = 0;

        for (std::size_t batch = 0; batch < batch_count && !ctx_.is_cancelled(); ++batch)
        {
            auto const first = batch * batch_size;
            auto const last = std::min(first + batch_size, total);

            if (ctx_.is_paused())
            {
                spdlog::info("run paused before batch {}/{}", batch + 1, batch_count);
            }
            if (!ctx_.wait_while_paused())
            {
                break;
            }

            spdlog::debug("batch {}/{}: devices {}..{}", batch + 1, batch_count, first + 1, last);

            bool interrupted = false;
            for (auto i = first; i < last; ++i)
            {
                if (!claim_slot(slots, ctx_))
                {
                    interrupted = true;
                    break;
                }

                auto const &unit = units[i];
                auto submitted = pool.submit(
                    [this, &unit, &slots, &machine, &aggregator, total, batch_count, batch]() -> void_result
                    {
                        slot_guard const guard{slots};

                        auto outcome = machine.run(unit);
                        auto fault = outcome.last_error.has_value() &&
                                             outcome.last_error->code == error_code::internal_fault
                                         ? std::optional<error>{*outcome.last_error}
                                         : std::nullopt;

                        progress_event event{
                            .kind = progress_kind::device_completed,
                            .devices_total = total,
                            .batch = batch + 1,
                            .batch_count = batch_count,
                            .target = outcome.target,
                            .terminal = outcome.terminal,
                            .elapsed = outcome.elapsed,
                        };

                        if (auto recorded = aggregator.record(std::move(outcome)); !recorded.has_value())
                        {
                            return recorded;
                        }

                        event.devices_completed = aggregator.completed();
                        event.counters = aggregator.counters();
                        emit(std::move(event));

                        if (fault.has_value())
                        {
                            return std::unexpected{*fault};
                        }
                        return {};
                    });
                if (!submitted.has_value())
                {
                    slots.release();
                    return std::unexpected{submitted.error()};
                }
                ++dispatched;
            }

            if (auto drained = pool.wait(); !drained.has_value())
            {
                spdlog::error("run aborted: {}", drained.error());
                return std::unexpected{drained.error()};
            }
            if (interrupted || ctx_.is_cancelled())
            {
                break;
            }

            emit(progress_event{
                .kind = progress_kind::batch_completed,
                .devices_completed = aggregator.completed(),
                .devices_total = total,
                .batch = batch + 1,
                .batch_count = batch_count,
                .counters = aggregator.counters(),
            });
        }

        // anything never handed to a worker is cancelled as a whole
        if (ctx_.is_cancelled())
        {
            aggregator.mark_cancelled();
            if (dispatched < total)
            {
                spdlog::warn("run cancelled, {} device(s) never started", total - dispatched);
            }
            for (auto i = dispatched; i < total; ++i)
            {
                if (auto recorded = aggregator.record(
                        cancelled_outcome(units[i], options_.clock, "cancelled before the device was started"));
                    !recorded.has_value())
                {
                    return std::unexpected{recorded.error()};
                }
            }
        }

        auto report = aggregator.final_report();
        if (!report.has_value())
        {
            return std::unexpected{report.error()};
        }

        emit(progress_event{
            .kind = progress_kind::run_finished,
            .devices_completed = aggregator.completed(),
            .devices_total = total,
            .batch = batch_count,
            .batch_count = batch_count,
            .counters = report->counters,
        });
        return report;
    }

} // namespace netrun
