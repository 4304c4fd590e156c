// tests/unit/test_scheduler.cpp - batching, concurrency bound, pause and cancel across a run

#include "common/test_helpers.hpp"

#include "netrun/scheduler.hpp"
#include <doctest/doctest.h>

#include <algorithm>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using netrun::command_status;
using netrun::progress_kind;
using netrun::session_state;
using netrun::testing::device_script;
using netrun::testing::fast_config;
using netrun::testing::make_units;
using netrun::testing::mock_transport;

namespace
{

    // hands out nothing, which no real transport should do
    class null_transport final : public netrun::transport
    {
    public:
        [[nodiscard]] auto connect(netrun::connect_request const &)
            -> netrun::result<std::unique_ptr<netrun::transport_session>> override
        {
            return std::unique_ptr<netrun::transport_session>{};
        }
    };

    [[nodiscard]] auto drain(netrun::progress_queue &queue) -> std::vector<netrun::progress_event>
    {
        std::vector<netrun::progress_event> events;
        while (auto event = queue.try_pop())
        {
            events.push_back(std::move(*event));
        }
        return events;
    }

} // anonymous namespace

TEST_SUITE("batch_scheduler")
{
    TEST_CASE("live sessions never exceed min(workers, batch size)")
    {
        struct shape
        {
            std::size_t workers;
            std::size_t batch;
            std::size_t devices;
        };

        for (auto const s : {shape{3, 5, 10}, shape{8, 2, 6}, shape{1, 4, 4}})
        {
            CAPTURE(s.workers);
            CAPTURE(s.batch);
            mock_transport link;
            link.script_default(device_script{.delay = 10ms});
            netrun::run_context const ctx{fast_config(s.workers, s.batch)};
            netrun::batch_scheduler scheduler{link, ctx};

            auto const report = scheduler.run(make_units(s.devices, {"show clock"}));
            REQUIRE(report.has_value());
            CHECK(report->counters.succeeded == s.devices);
            CHECK(link.high_water() >= 1);
            CHECK(link.high_water() <= std::min(s.workers, s.batch));
            CHECK(link.live() == 0);
        }
    }

    TEST_CASE("report order is device order, not completion order")
    {
        mock_transport link;
        // earlier devices answer slower
        for (std::size_t i = 0; i < 6; ++i)
        {
            link.script("10.0.0." + std::to_string(i + 1),
                        device_script{.delay = std::chrono::milliseconds(30 - 5 * static_cast<int>(i))});
        }
        netrun::run_context const ctx{fast_config(6, 6)};
        netrun::batch_scheduler scheduler{link, ctx};

        auto const units = make_units(6, {"show version"});
        auto const report = scheduler.run(units);
        REQUIRE(report.has_value());
        REQUIRE(report->entries.size() == units.size());
        for (std::size_t i = 0; i < units.size(); ++i)
        {
            CHECK(report->entries[i].index == i);
            CHECK(report->entries[i].target.address == units[i].target.address);
        }
    }

    TEST_CASE("a connect failure stays with its device")
    {
        mock_transport link;
        link.script("10.0.0.2",
                    device_script{.connect_error = netrun::error{netrun::error_code::connect_failed, "unreachable"}});
        netrun::run_context const ctx{fast_config(2, 2)};
        netrun::progress_queue progress;
        netrun::batch_scheduler scheduler{link, ctx, {.progress = &progress}};

        auto const report = scheduler.run(make_units(3, {"show version"}));
        REQUIRE(report.has_value());
        CHECK(report->counters == netrun::run_counters{.succeeded = 2, .failed = 1, .skipped = 0, .cancelled = 0});
        CHECK(report->entries[1].terminal == session_state::terminal_failure);
        CHECK(report->entries[0].terminal == session_state::terminal_success);
        CHECK(report->entries[2].terminal == session_state::terminal_success);
        CHECK(report->failures_of(netrun::failure_kind::connect) == 1);

        // the third device belongs to the second batch
        auto const events = drain(progress);
        auto const first_batch_done = std::find_if(events.begin(), events.end(), [](auto const &e)
                                                   { return e.kind == progress_kind::batch_completed; });
        REQUIRE(first_batch_done != events.end());
        CHECK(first_batch_done->batch == 1);
        CHECK(first_batch_done->devices_completed == 2);
        auto const third = std::find_if(events.begin(), events.end(), [](auto const &e)
                                        { return e.target.has_value() && e.target->address == "10.0.0.3"; });
        REQUIRE(third != events.end());
        CHECK(first_batch_done < third);
        CHECK(third->batch == 2);
    }

    TEST_CASE("pause holds the next batch until resume")
    {
        mock_transport link;
        netrun::run_context ctx{fast_config(2, 2)};
        netrun::batch_scheduler scheduler{link, ctx,
                                          {.observer = [&ctx](netrun::execution_unit const &unit, session_state state)
                                           {
                                               // the second device of the first batch is always dispatched last
                                               if (unit.index == 1 && netrun::is_terminal(state))
                                               {
                                                   ctx.pause();
                                               }
                                           }}};

        netrun::result<netrun::execution_report> report{std::unexpected{netrun::error{}}};
        std::thread runner{[&] { report = scheduler.run(make_units(4, {"show clock"})); }};

        CHECK(netrun::testing::eventually([&] { return link.connect_count() == 2 && link.live() == 0; }));
        std::this_thread::sleep_for(50ms);
        CHECK(ctx.is_paused());
        CHECK_FALSE(link.connected("10.0.0.3"));
        CHECK_FALSE(link.connected("10.0.0.4"));

        ctx.resume();
        runner.join();

        REQUIRE(report.has_value());
        CHECK(report->counters.succeeded == 4);
        CHECK(link.connected("10.0.0.4"));
    }

    TEST_CASE("pause raised while waiting for a free session holds the rest of the batch")
    {
        mock_transport link;
        auto const hold = std::make_shared<netrun::testing::gate>();
        link.script("10.0.0.1", device_script{.hold = hold});
        // one session at a time, so the second device waits for the first to finish
        netrun::run_context ctx{fast_config(1, 3)};
        netrun::batch_scheduler scheduler{link, ctx};

        netrun::result<netrun::execution_report> report{std::unexpected{netrun::error{}}};
        std::thread runner{[&] { report = scheduler.run(make_units(3, {"show clock"})); }};

        CHECK(netrun::testing::eventually([&] { return link.connect_count() == 1; }));
        std::this_thread::sleep_for(20ms);
        ctx.pause();
        hold->open();

        CHECK(netrun::testing::eventually([&] { return link.live() == 0; }));
        std::this_thread::sleep_for(50ms);
        CHECK(ctx.is_paused());
        CHECK(link.connect_count() == 1);
        CHECK_FALSE(link.connected("10.0.0.2"));
        CHECK_FALSE(link.connected("10.0.0.3"));

        ctx.resume();
        runner.join();

        REQUIRE(report.has_value());
        CHECK(report->counters.succeeded == 3);
        CHECK(link.connected("10.0.0.3"));
        CHECK(link.high_water() == 1);
    }

    TEST_CASE("units whose mode differs from the run mode are refused")
    {
        mock_transport link;
        netrun::run_context const ctx{fast_config(2, 2)};
        netrun::batch_scheduler scheduler{link, ctx};

        auto units = make_units(2, {"show clock"});
        units[1] = netrun::testing::make_unit(1, "10.0.0.2", {"hostname r2"}, netrun::execution_mode::config);

        auto const report = scheduler.run(units);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == netrun::error_code::invalid_config);
        CHECK(report.error().detail.find("10.0.0.2") != std::string::npos);
        CHECK(link.connect_count() == 0);

        auto cfg = fast_config(2, 2);
        cfg.mode = netrun::execution_mode::config;
        netrun::run_context const config_ctx{cfg};
        netrun::batch_scheduler config_scheduler{link, config_ctx};
        auto const refused = config_scheduler.run(make_units(1, {"hostname r1"}));
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == netrun::error_code::invalid_config);
        CHECK(link.connect_count() == 0);
    }

    TEST_CASE("cancel leaves undispatched devices wholly cancelled")
    {
        mock_transport link;
        netrun::run_context ctx{fast_config(1, 5)};
        netrun::progress_queue progress;
        netrun::batch_scheduler scheduler{link, ctx,
                                          {.observer = [&ctx](netrun::execution_unit const &unit, session_state state)
                                           {
                                               if (unit.index == 1 && netrun::is_terminal(state))
                                               {
                                                   ctx.cancel();
                                               }
                                           },
                                           .progress = &progress}};

        auto const report = scheduler.run(make_units(5, {"show version", "show clock"}));
        REQUIRE(report.has_value());
        CHECK(report->cancelled);
        CHECK(report->complete());
        CHECK(report->counters.succeeded == 4);
        CHECK(report->counters.cancelled == 6);

        for (std::size_t i = 2; i < 5; ++i)
        {
            CAPTURE(i);
            auto const &entry = report->entries[i];
            CHECK(entry.terminal == session_state::terminal_cancelled);
            CHECK(entry.attempts == 0);
            CHECK_FALSE(link.connected(entry.target.address));
            for (auto const &row : entry.results)
            {
                CHECK(row.status == command_status::cancelled);
            }
        }
        CHECK(link.connect_count() == 2);

        auto const events = drain(progress);
        REQUIRE_FALSE(events.empty());
        CHECK(events.back().kind == progress_kind::run_finished);
        CHECK(events.back().devices_completed == 5);
        // the only batch was cut short, so it never completes
        CHECK(std::none_of(events.begin(), events.end(),
                           [](auto const &e) { return e.kind == progress_kind::batch_completed; }));
    }

    TEST_CASE("progress events frame the run")
    {
        mock_transport link;
        netrun::run_context const ctx{fast_config(2, 2)};
        netrun::progress_queue progress;
        netrun::batch_scheduler scheduler{link, ctx, {.progress = &progress}};

        auto const report = scheduler.run(make_units(5, {"show clock"}));
        REQUIRE(report.has_value());

        auto const events = drain(progress);
        REQUIRE(events.size() == 1 + 5 + 3 + 1);
        CHECK(events.front().kind == progress_kind::run_started);
        CHECK(events.front().batch_count == 3);
        CHECK(events.back().kind == progress_kind::run_finished);
        CHECK(events.back().percent() == doctest::Approx(100.0));

        auto const count = [&](progress_kind const kind)
        { return std::count_if(events.begin(), events.end(), [&](auto const &e) { return e.kind == kind; }); };
        CHECK(count(progress_kind::device_completed) == 5);
        CHECK(count(progress_kind::batch_completed) == 3);

        std::vector<std::size_t> batch_marks;
        for (auto const &e : events)
        {
            if (e.kind == progress_kind::batch_completed)
            {
                batch_marks.push_back(e.devices_completed);
            }
        }
        CHECK(batch_marks == std::vector<std::size_t>{2, 4, 5});
    }

    TEST_CASE("duplicate indices are an internal fault")
    {
        mock_transport link;
        netrun::run_context const ctx{fast_config(2, 2)};
        netrun::batch_scheduler scheduler{link, ctx};

        auto units = make_units(2, {"show clock"});
        units[1].index = 0;

        auto const report = scheduler.run(units);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == netrun::error_code::internal_fault);
    }

    TEST_CASE("a transport that returns no session aborts the run")
    {
        null_transport link;
        netrun::run_context const ctx{fast_config(2, 2, 3)};
        netrun::batch_scheduler scheduler{link, ctx};

        auto const report = scheduler.run(make_units(2, {"show clock"}));
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == netrun::error_code::internal_fault);
    }

    TEST_CASE("invalid configuration is refused before anything starts")
    {
        mock_transport link;
        auto cfg = fast_config(2, 2);
        cfg.max_workers = 0;
        netrun::run_context const ctx{cfg};
        netrun::batch_scheduler scheduler{link, ctx};

        auto const report = scheduler.run(make_units(2, {"show clock"}));
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == netrun::error_code::invalid_config);
        CHECK(link.connect_count() == 0);
    }

    TEST_CASE("an empty device list finishes at once")
    {
        mock_transport link;
        netrun::run_context const ctx{fast_config(2, 2)};
        netrun::batch_scheduler scheduler{link, ctx};

        auto const report = scheduler.run({});
        REQUIRE(report.has_value());
        CHECK(report->entries.empty());
        CHECK(report->all_succeeded());
    }
}
