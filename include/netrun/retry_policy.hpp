#pragma once

// retry_policy.hpp - which failures earn another session attempt

#include "device.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace netrun
{

    enum class retry_scope : std::uint8_t
    {
        none,         // not retried
        full_session, // reconnect and run the whole command set again
    };

    // what a failure of this kind does to the rest of the command set
    enum class failure_effect : std::uint8_t
    {
        whole_session,   // every command shares the failure
        single_command,  // only that command is a failure, the session continues
        abort_remaining, // that command fails, the rest of the block is skipped
    };

    struct retry_decision
    {
        bool retryable{false};
        retry_scope scope{retry_scope::none};
        failure_effect effect{failure_effect::whole_session};
    };

    class retry_policy
    {
    private:
        std::size_t retry_count_{0};

    public:
        constexpr explicit retry_policy(std::size_t retry_count) noexcept : retry_count_{retry_count} {}

        [[nodiscard]] static constexpr auto classify(failure_kind const kind, execution_mode const mode) noexcept
            -> retry_decision
        {
            switch (kind)
            {
            case failure_kind::connect:
            case failure_kind::timeout:
                return {.retryable = true, .scope = retry_scope::full_session, .effect = failure_effect::whole_session};
            case failure_kind::auth:
                return {.retryable = false, .scope = retry_scope::none, .effect = failure_effect::whole_session};
            case failure_kind::command:
                return {.retryable = false,
                        .scope = retry_scope::none,
                        .effect = mode == execution_mode::config ? failure_effect::abort_remaining
                                                                 : failure_effect::single_command};
            case failure_kind::cancelled:
                return {.retryable = false, .scope = retry_scope::none, .effect = failure_effect::whole_session};
            }
            return {};
        }

        // `attempt` counts from 1; the first run is not a retry
        [[nodiscard]] constexpr auto should_retry(failure_kind const kind, std::size_t const attempt) const noexcept
            -> bool
        {
            return classify(kind, execution_mode::normal).retryable && attempt <= retry_count_;
        }

        [[nodiscard]] constexpr auto max_attempts() const noexcept -> std::size_t { return retry_count_ + 1; }

        [[nodiscard]] constexpr auto retry_count() const noexcept -> std::size_t { return retry_count_; }
    };

} // namespace netrun
