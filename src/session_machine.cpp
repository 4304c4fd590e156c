// session_machine.cpp - per-device session lifecycle and retry loop

#include "netrun/session_machine.hpp"

#include "netrun/device_driver.hpp"
#include "netrun/retry_policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace netrun
{

    namespace
    {

        // fills results in command order, one row per command and never more
        class row_builder
        {
        private:
            command_set const &commands_;
            clock_fn clock_;
            std::vector<session_result> rows_{};

        public:
            row_builder(command_set const &commands, clock_fn clock) : commands_{commands}, clock_{clock}
            {
                rows_.reserve(commands_.size());
            }

            [[nodiscard]] auto done() const noexcept -> bool { return rows_.size() >= commands_.size(); }

            [[nodiscard]] auto next_command() const -> std::string const & { return commands_.commands[rows_.size()]; }

            auto add(command_status const status, std::string output, std::optional<failure_kind> const kind = {})
                -> void
            {
                if (done())
                {
                    return;
                }
                rows_.push_back(session_result{
                    .command = next_command(),
                    .output = std::move(output),
                    .status = status,
                    .failure = status == command_status::failure ? kind : std::nullopt,
                    .timestamp = clock_(),
                });
            }

            auto fill(command_status const status, std::string_view const detail,
                      std::optional<failure_kind> const kind = {}) -> void
            {
                while (!done())
                {
                    add(status, std::string{detail}, kind);
                }
            }

            [[nodiscard]] auto view() const noexcept -> std::vector<session_result> const & { return rows_; }

            [[nodiscard]] auto take() noexcept -> std::vector<session_result> { return std::move(rows_); }
        };

    } // namespace

    auto to_string(session_state const state) noexcept -> std::string_view
    {
        switch (state)
        {
        case session_state::idle:
            return "idle";
        case session_state::connecting:
            return "connecting";
        case session_state::authenticating:
            return "authenticating";
        case session_state::privilege_escalation:
            return "privilege_escalation";
        case session_state::ready:
            return "ready";
        case session_state::executing:
            return "executing";
        case session_state::disconnecting:
            return "disconnecting";
        case session_state::terminal_success:
            return "success";
        case session_state::terminal_failure:
            return "failure";
        case session_state::terminal_cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    auto terminal_state_of(std::vector<session_result> const &results) noexcept -> session_state
    {
        auto const any = [&](command_status const status)
        { return std::any_of(results.begin(), results.end(), [&](auto const &r) { return r.status == status; }); };

        if (any(command_status::failure))
        {
            return session_state::terminal_failure;
        }
        if (any(command_status::cancelled))
        {
            return session_state::terminal_cancelled;
        }
        return session_state::terminal_success;
    }

    auto cancelled_outcome(execution_unit const &unit, clock_fn const clock, std::string_view const detail)
        -> unit_outcome
    {
        row_builder rows{unit.commands, clock};
        rows.fill(command_status::cancelled, detail);
        return unit_outcome{
            .index = unit.index,
            .target = unit.target,
            .terminal = session_state::terminal_cancelled,
            .results = rows.take(),
            .attempts = 0,
            .last_error = {},
            .elapsed = std::chrono::milliseconds{0},
        };
    }

    // ============================================================================
    // session_machine
    // ============================================================================

    session_machine::session_machine(transport &link, run_context const &ctx, clock_fn clock) noexcept
        : link_{link}, ctx_{ctx}, clock_{clock}
    {
    }

    auto session_machine::transition(execution_unit const &unit, session_state const state) -> void
    {
        spdlog::trace("{}: -> {}", unit.target.label(), to_string(state));
        if (observer_)
        {
            observer_(unit, state);
        }
    }

    auto session_machine::run_attempt(execution_unit const &unit) -> attempt_outcome
    {
        auto const &cfg = ctx_.config();
        auto const mode = unit.commands.mode;
        row_builder rows{unit.commands, clock_};

        transition(unit, session_state::idle);

        if (ctx_.is_cancelled())
        {
            rows.fill(command_status::cancelled, "cancelled before the session started");
            transition(unit, session_state::terminal_cancelled);
            return {.terminal = session_state::terminal_cancelled, .results = rows.take(), .session_failure = {}};
        }

        // connect and login failures cover every command, nothing was attempted
        auto fail_session = [&](error const &err) -> attempt_outcome
        {
            rows.fill(command_status::failure, err.message(), failure_kind_of(err.code));
            transition(unit, session_state::terminal_failure);
            return {.terminal = session_state::terminal_failure, .results = rows.take(), .session_failure = err};
        };

        transition(unit, session_state::connecting);
        auto session = driver_session::connect(unit.driver, link_, unit.target, unit.creds,
                                               driver_timeouts{.connect = cfg.connect_timeout,
                                                               .command = cfg.command_timeout});
        if (!session.has_value())
        {
            return fail_session(session.error());
        }

        auto abandon = [&](error const &err) -> attempt_outcome
        {
            transition(unit, session_state::disconnecting);
            session->close();
            return fail_session(err);
        };

        transition(unit, session_state::authenticating);
        if (auto login = session->login(unit.creds); !login.has_value())
        {
            return abandon(login.error());
        }

        if (unit.creds.has_elevation())
        {
            if (supports_privilege_escalation(unit.driver))
            {
                transition(unit, session_state::privilege_escalation);
                if (auto escalated = session->enter_privileged_mode(*unit.creds.elevation_secret);
                    !escalated.has_value())
                {
                    return abandon(escalated.error());
                }
            }
            else
            {
                spdlog::debug("{}: {} has no privileged mode, elevation secret unused", unit.target.label(),
                              session->traits().name);
            }
        }

        transition(unit, session_state::ready);
        if (auto prepared = session->prepare_terminal(); !prepared.has_value())
        {
            return abandon(prepared.error());
        }

        transition(unit, session_state::executing);
        std::optional<error> session_failure;

        if (mode == execution_mode::normal)
        {
            while (!rows.done())
            {
                if (ctx_.is_cancelled())
                {
                    rows.fill(command_status::cancelled, "cancelled");
                    break;
                }

                auto const &command = rows.next_command();
                auto output = session->send_command(command);
                if (output.has_value())
                {
                    rows.add(command_status::success, std::move(*output));
                    continue;
                }

                auto const kind = failure_kind_of(output.error().code);
                if (retry_policy::classify(kind, mode).effect == failure_effect::single_command)
                {
                    spdlog::warn("{}: '{}' rejected", unit.target.label(), command);
                    rows.add(command_status::failure, output.error().detail, kind);
                    continue;
                }

                // connection lost or stalled; what is left cannot run on this session
                auto const skipped = fmt::format("skipped, session lost at '{}'", command);
                rows.add(command_status::failure, output.error().message(), kind);
                rows.fill(command_status::skipped, skipped);
                session_failure = output.error();
            }
        }
        else if (ctx_.is_cancelled())
        {
            rows.fill(command_status::cancelled, "cancelled before the configuration block");
        }
        else
        {
            bool in_config = false;
            if (auto entered = session->enter_config_mode(); !entered.has_value())
            {
                auto const kind = failure_kind_of(entered.error().code);
                rows.add(command_status::failure,
                         fmt::format("'{}' failed: {}", session->traits().config_enter, entered.error().message()),
                         kind);
                rows.fill(command_status::skipped, "skipped, configuration mode unavailable");
                if (kind != failure_kind::command)
                {
                    session_failure = entered.error();
                }
            }
            else
            {
                in_config = true;
            }

            while (in_config && !rows.done())
            {
                auto const &command = rows.next_command();
                auto output = session->send_command(command);
                if (output.has_value())
                {
                    rows.add(command_status::success, std::move(*output));
                    continue;
                }

                auto const kind = failure_kind_of(output.error().code);
                auto const skipped = fmt::format("skipped, block aborted at '{}'", command);
                spdlog::warn("{}: configuration block aborted at '{}'", unit.target.label(), command);
                rows.add(command_status::failure,
                         kind == failure_kind::command ? output.error().detail : output.error().message(), kind);
                rows.fill(command_status::skipped, skipped);
                if (kind != failure_kind::command)
                {
                    session_failure = output.error();
                    in_config = false;
                }
            }

            if (in_config)
            {
                if (auto left = session->exit_config_mode(); !left.has_value())
                {
                    spdlog::warn("{}: leaving configuration mode failed: {}", unit.target.label(), left.error());
                }
            }
        }

        transition(unit, session_state::disconnecting);
        session->close();

        auto const terminal = terminal_state_of(rows.view());
        transition(unit, terminal);
        return {.terminal = terminal, .results = rows.take(), .session_failure = std::move(session_failure)};
    }

    auto session_machine::run(execution_unit const &unit) -> unit_outcome
    {
        auto const started = std::chrono::steady_clock::now();
        auto const label = unit.target.label();
        retry_policy const policy{ctx_.config().retry_count};

        unit_outcome outcome{.index = unit.index, .target = unit.target};

        for (std::size_t attempt = 1;; ++attempt)
        {
            spdlog::debug("{}: attempt {}/{}", label, attempt, policy.max_attempts());

            auto pass = run_attempt(unit);
            outcome.attempts = attempt;
            outcome.terminal = pass.terminal;
            outcome.results = std::move(pass.results);
            outcome.last_error = pass.session_failure;

            if (!pass.session_failure.has_value())
            {
                break;
            }

            auto const &err = *pass.session_failure;
            if (err.code == error_code::internal_fault)
            {
                break;
            }

            auto const kind = failure_kind_of(err.code);
            if (!policy.should_retry(kind, attempt))
            {
                spdlog::error("{}: attempt {}/{} failed, giving up: {}", label, attempt, policy.max_attempts(), err);
                break;
            }

            auto const delay = ctx_.config().retry_delay;
            spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms", label, attempt, policy.max_attempts(),
                         err, delay.count());

            if (!ctx_.sleep_for(delay))
            {
                auto cancelled = cancelled_outcome(unit, clock_, fmt::format("cancelled before retry, last error: {}",
                                                                             err.message()));
                outcome.terminal = cancelled.terminal;
                outcome.results = std::move(cancelled.results);
                transition(unit, session_state::terminal_cancelled);
                break;
            }
        }

        outcome.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        spdlog::info("{}: {} after {} attempt(s) in {:.2f}s", label, to_string(outcome.terminal), outcome.attempts,
                     static_cast<double>(outcome.elapsed.count()) / 1000.0);
        return outcome;
    }

} // namespace netrun
