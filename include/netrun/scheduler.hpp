#pragma once

// scheduler.hpp - batches execution units onto the worker pool
// batches run one after another; inside a batch at most min(workers, batch size) sessions are live

#include "aggregator.hpp"
#include "common.hpp"
#include "execution_unit.hpp"
#include "progress.hpp"
#include "run_context.hpp"
#include "session_machine.hpp"
#include "transport.hpp"

#include <chrono>
#include <vector>

namespace netrun
{

    struct scheduler_options
    {
        clock_fn clock{&std::chrono::system_clock::now};
        state_observer observer{};      // must be safe to call from several workers
        progress_queue *progress{nullptr}; // not owned, not closed by the scheduler
    };

    class batch_scheduler
    {
    private:
        transport &link_;
        run_context const &ctx_;
        scheduler_options options_;

    public:
        batch_scheduler(transport &link, run_context const &ctx, scheduler_options options = {});

        // units must carry distinct indices 0..size-1
        // per-device failures land in the report; the error side is for invalid_config and internal_fault only
        [[nodiscard]] auto run(std::vector<execution_unit> const &units) -> result<execution_report>;

    private:
        auto emit(progress_event event) const -> void;
    };

} // namespace netrun
