#pragma once

// device.hpp - devices, credentials, command sets and per-command results

#include "common.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netrun
{

    // ============================================================================
    // execution mode
    // ============================================================================

    enum class execution_mode : std::uint8_t
    {
        normal, // every command sent and recorded on its own
        config, // whole command set is one block inside the configuration context
    };

    [[nodiscard]] auto to_string(execution_mode mode) noexcept -> std::string_view;

    [[nodiscard]] auto parse_execution_mode(std::string_view str) -> result<execution_mode>;

    // ============================================================================
    // credentials - never formatted in cleartext
    // ============================================================================

    struct credentials
    {
        std::string username{};
        std::string password{};
        std::optional<std::string> elevation_secret{};

        [[nodiscard]] auto has_elevation() const noexcept -> bool
        {
            return elevation_secret.has_value() && !elevation_secret->empty();
        }
    };

    // ============================================================================
    // device identity
    // ============================================================================

    struct device
    {
        std::string address{};
        std::string dns{};
        std::string device_type{};
        std::optional<std::string> credential_profile{};
        std::uint16_t port{22};

        // "address (dns)" or just the address
        [[nodiscard]] auto label() const -> std::string;

        // identity used to merge repeated rows of a device table
        [[nodiscard]] auto key() const -> std::string;
    };

    struct command_set
    {
        std::vector<std::string> commands{};
        execution_mode mode{execution_mode::normal};

        [[nodiscard]] auto size() const noexcept -> std::size_t { return commands.size(); }
        [[nodiscard]] auto empty() const noexcept -> bool { return commands.empty(); }
    };

    // ============================================================================
    // per-command outcome
    // ============================================================================

    enum class command_status : std::uint8_t
    {
        success,
        failure,
        skipped,
        cancelled,
    };

    enum class failure_kind : std::uint8_t
    {
        connect,
        auth,
        timeout,
        command,
        cancelled,
    };

    [[nodiscard]] auto to_string(command_status status) noexcept -> std::string_view;

    [[nodiscard]] auto to_string(failure_kind kind) noexcept -> std::string_view;

    // maps a device-level error code onto the failure taxonomy
    [[nodiscard]] auto failure_kind_of(error_code ec) noexcept -> failure_kind;

    struct session_result
    {
        std::string command{};
        std::string output{}; // captured output, or the error detail for non-success rows
        command_status status{command_status::skipped};
        std::optional<failure_kind> failure{};
        std::chrono::system_clock::time_point timestamp{};

        [[nodiscard]] auto same_outcome(session_result const &other) const noexcept -> bool
        {
            return command == other.command && output == other.output && status == other.status &&
                   failure == other.failure;
        }
    };

    using clock_fn = std::chrono::system_clock::time_point (*)();

} // namespace netrun

// credentials print as "user:***" so they can appear in logs safely
template <>
struct fmt::formatter<netrun::credentials> : fmt::formatter<std::string_view>
{
    auto format(netrun::credentials const &c, format_context &ctx) const
    {
        auto const masked = fmt::format("{}:***{}", c.username, c.has_elevation() ? " (+enable)" : "");
        return fmt::formatter<std::string_view>::format(masked, ctx);
    }
};

template <>
struct fmt::formatter<netrun::command_status> : fmt::formatter<std::string_view>
{
    auto format(netrun::command_status const s, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netrun::to_string(s), ctx);
    }
};

template <>
struct fmt::formatter<netrun::failure_kind> : fmt::formatter<std::string_view>
{
    auto format(netrun::failure_kind const k, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netrun::to_string(k), ctx);
    }
};

template <>
struct fmt::formatter<netrun::execution_mode> : fmt::formatter<std::string_view>
{
    auto format(netrun::execution_mode const m, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netrun::to_string(m), ctx);
    }
};
