#pragma once

// session_machine.hpp - drives one device through connect, login, optional escalation,
// execution and teardown, then applies the retry policy across attempts

#include "common.hpp"
#include "device.hpp"
#include "execution_unit.hpp"
#include "run_context.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace netrun
{

    // ============================================================================
    // states
    // ============================================================================

    enum class session_state : std::uint8_t
    {
        idle,
        connecting,
        authenticating,
        privilege_escalation,
        ready,
        executing,
        disconnecting,
        terminal_success,
        terminal_failure,
        terminal_cancelled,
    };

    [[nodiscard]] auto to_string(session_state state) noexcept -> std::string_view;

    [[nodiscard]] constexpr auto is_terminal(session_state const state) noexcept -> bool
    {
        return state == session_state::terminal_success || state == session_state::terminal_failure ||
               state == session_state::terminal_cancelled;
    }

    // called on every transition, from the worker thread running the unit
    using state_observer = std::function<void(execution_unit const &unit, session_state state)>;

    // ============================================================================
    // outcomes
    // ============================================================================

    // one pass through the machine
    struct attempt_outcome
    {
        session_state terminal{session_state::terminal_failure};
        std::vector<session_result> results{};
        std::optional<error> session_failure{}; // connect, auth or transport loss; the only thing worth retrying
    };

    // what gets recorded for a device once every attempt is spent
    struct unit_outcome
    {
        std::size_t index{0};
        device target{};
        session_state terminal{session_state::terminal_failure};
        std::vector<session_result> results{};
        std::size_t attempts{0};
        std::optional<error> last_error{};
        std::chrono::milliseconds elapsed{0};
    };

    // every row cancelled; used for units the scheduler never starts
    [[nodiscard]] auto cancelled_outcome(execution_unit const &unit, clock_fn clock, std::string_view detail)
        -> unit_outcome;

    // failure if any row failed, else cancelled if any row was cancelled, else success
    [[nodiscard]] auto terminal_state_of(std::vector<session_result> const &results) noexcept -> session_state;

    // ============================================================================
    // session machine
    // ============================================================================

    class session_machine
    {
    private:
        transport &link_;
        run_context const &ctx_;
        clock_fn clock_;
        state_observer observer_{};

    public:
        session_machine(transport &link, run_context const &ctx,
                        clock_fn clock = &std::chrono::system_clock::now) noexcept;

        auto set_observer(state_observer observer) -> void { observer_ = std::move(observer); }

        // a single attempt, no retries; never throws device-level errors, they become rows
        [[nodiscard]] auto run_attempt(execution_unit const &unit) -> attempt_outcome;

        // attempts until success, a non-retryable failure, exhausted retries or cancellation
        [[nodiscard]] auto run(execution_unit const &unit) -> unit_outcome;

    private:
        auto transition(execution_unit const &unit, session_state state) -> void;
    };

} // namespace netrun
