// tests/unit/test_aggregator.cpp - slot ownership, ordering and counters

#include "common/test_helpers.hpp"

#include "netrun/aggregator.hpp"
#include <doctest/doctest.h>

#include <thread>

using netrun::command_status;
using netrun::failure_kind;
using netrun::session_result;
using netrun::session_state;

namespace
{

    [[nodiscard]] auto outcome_of(std::size_t const index, std::vector<session_result> rows) -> netrun::unit_outcome
    {
        auto const state = netrun::terminal_state_of(rows);
        return netrun::unit_outcome{
            .index = index,
            .target = netrun::device{.address = "10.0.0." + std::to_string(index + 1)},
            .terminal = state,
            .results = std::move(rows),
            .attempts = 1,
        };
    }

    [[nodiscard]] auto row(command_status const status, std::optional<failure_kind> const kind = {}) -> session_result
    {
        return session_result{.command = "show clock", .output = "", .status = status, .failure = kind};
    }

} // anonymous namespace

TEST_SUITE("result_aggregator")
{
    TEST_CASE("each slot takes exactly one result")
    {
        netrun::result_aggregator agg{2};
        REQUIRE(agg.record(outcome_of(1, {row(command_status::success)})).has_value());

        auto const again = agg.record(outcome_of(1, {row(command_status::failure, failure_kind::connect)}));
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == netrun::error_code::internal_fault);

        // the first write stands
        auto const snap = agg.snapshot();
        REQUIRE(snap.entries.size() == 1);
        CHECK(snap.entries[0].results[0].status == command_status::success);
        CHECK(agg.completed() == 1);
    }

    TEST_CASE("an index past the device list is refused")
    {
        netrun::result_aggregator agg{1};
        auto const recorded = agg.record(outcome_of(1, {}));
        REQUIRE_FALSE(recorded.has_value());
        CHECK(recorded.error().code == netrun::error_code::internal_fault);
        CHECK(agg.completed() == 0);
    }

    TEST_CASE("snapshot follows device order regardless of completion order")
    {
        netrun::result_aggregator agg{3};
        REQUIRE(agg.record(outcome_of(2, {row(command_status::success)})).has_value());
        REQUIRE(agg.record(outcome_of(0, {row(command_status::failure, failure_kind::timeout),
                                          row(command_status::skipped)}))
                    .has_value());

        auto const partial = agg.snapshot();
        CHECK_FALSE(partial.complete());
        REQUIRE(partial.entries.size() == 2);
        CHECK(partial.entries[0].index == 0);
        CHECK(partial.entries[1].index == 2);
        CHECK(agg.is_recorded(2));
        CHECK_FALSE(agg.is_recorded(1));

        auto const early = agg.final_report();
        REQUIRE_FALSE(early.has_value());
        CHECK(early.error().code == netrun::error_code::internal_fault);

        REQUIRE(agg.record(outcome_of(1, {row(command_status::cancelled)})).has_value());
        auto const report = agg.final_report();
        REQUIRE(report.has_value());
        CHECK(report->complete());
        CHECK(report->entries[1].index == 1);
        CHECK(report->counters == netrun::run_counters{.succeeded = 1, .failed = 1, .skipped = 1, .cancelled = 1});
        CHECK(report->failures_of(failure_kind::timeout) == 1);
        CHECK(report->failures_of(failure_kind::connect) == 0);
        CHECK_FALSE(report->all_succeeded());
    }

    TEST_CASE("running counters match the final report")
    {
        constexpr std::size_t devices = 64;
        netrun::result_aggregator agg{devices};

        std::vector<std::thread> writers;
        for (std::size_t t = 0; t < 4; ++t)
        {
            writers.emplace_back(
                [&agg, t]
                {
                    for (std::size_t i = t; i < devices; i += 4)
                    {
                        auto const status = i % 3 == 0 ? command_status::failure : command_status::success;
                        auto const kind =
                            status == command_status::failure ? std::optional{failure_kind::auth} : std::nullopt;
                        static_cast<void>(agg.record(outcome_of(i, {row(status, kind), row(command_status::success)})));
                    }
                });
        }
        for (auto &w : writers)
        {
            w.join();
        }

        auto const report = agg.final_report();
        REQUIRE(report.has_value());
        CHECK(agg.completed() == devices);
        CHECK(agg.counters() == report->counters);
        CHECK(report->counters.total() == devices * 2);
        CHECK(report->counters.failed == 22);
        CHECK(report->failures_of(failure_kind::auth) == 22);
        for (std::size_t i = 0; i < devices; ++i)
        {
            CHECK(report->entries[i].index == i);
        }
    }

    TEST_CASE("cancelled flag and all_succeeded")
    {
        netrun::result_aggregator agg{1};
        REQUIRE(agg.record(outcome_of(0, {row(command_status::success)})).has_value());

        auto report = agg.final_report();
        REQUIRE(report.has_value());
        CHECK(report->all_succeeded());
        CHECK(report->entries[0].terminal == session_state::terminal_success);

        agg.mark_cancelled();
        report = agg.final_report();
        REQUIRE(report.has_value());
        CHECK(report->cancelled);
        CHECK_FALSE(report->all_succeeded());
    }

    TEST_CASE("an empty run")
    {
        netrun::result_aggregator const agg{0};
        auto const report = agg.final_report();
        REQUIRE(report.has_value());
        CHECK(report->entries.empty());
        CHECK(report->counters.total() == 0);
    }
}
