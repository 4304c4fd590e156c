#pragma once

// common.hpp - error codes, result aliases and small string helpers
// shared by every netrun module

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace netrun
{

    // ============================================================================
    // error handling - per-device failures travel as values, never as exceptions
    // ============================================================================

    enum class error_code : std::uint8_t
    {
        success = 0,

        // detected before dispatch, aborts the whole run
        validation_failed,
        unsupported_device_type,
        missing_column,
        invalid_config,
        credential_unavailable,

        // per device, recorded into the report
        connect_failed,
        auth_failed,
        timeout,
        command_failed,
        cancelled,

        // fatal to the run, reported distinctly from device failures
        internal_fault,

        // local io
        file_open_failed,
        file_write_failed,
    };

    struct error_code_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_code const ec) noexcept -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::validation_failed:
                return "validation_failed";
            case error_code::unsupported_device_type:
                return "unsupported_device_type";
            case error_code::missing_column:
                return "missing_column";
            case error_code::invalid_config:
                return "invalid_config";
            case error_code::credential_unavailable:
                return "credential_unavailable";
            case error_code::connect_failed:
                return "connect_failed";
            case error_code::auth_failed:
                return "auth_failed";
            case error_code::timeout:
                return "timeout";
            case error_code::command_failed:
                return "command_failed";
            case error_code::cancelled:
                return "cancelled";
            case error_code::internal_fault:
                return "internal_fault";
            case error_code::file_open_failed:
                return "file_open_failed";
            case error_code::file_write_failed:
                return "file_write_failed";
            }
            return "unknown_error";
        }
    };

    [[nodiscard]] auto make_error_code(error_code e) noexcept -> std::error_code;

    // validation errors abort a run before anything is dispatched
    [[nodiscard]] constexpr auto is_validation_error(error_code const ec) noexcept -> bool
    {
        return ec == error_code::validation_failed || ec == error_code::unsupported_device_type ||
               ec == error_code::missing_column || ec == error_code::invalid_config ||
               ec == error_code::credential_unavailable;
    }

    // ============================================================================
    // error value - a code plus the detail a human needs to act on it
    // ============================================================================

    struct error
    {
        error_code code{error_code::success};
        std::string detail{};

        [[nodiscard]] auto message() const -> std::string;

        [[nodiscard]] auto operator==(error const &) const -> bool = default;
    };

    template <typename... Args>
    [[nodiscard]] auto make_error(error_code const code, fmt::format_string<Args...> fmt_str, Args &&...args) -> error
    {
        return error{code, fmt::format(fmt_str, std::forward<Args>(args)...)};
    }

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    // ============================================================================
    // string helpers
    // ============================================================================

    namespace text
    {
        [[nodiscard]] auto trim(std::string_view str) noexcept -> std::string_view;

        [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

        // splits on '\n', dropping a trailing '\r' from each line
        [[nodiscard]] auto split_lines(std::string_view str) -> std::vector<std::string_view>;
    } // namespace text

} // namespace netrun

template <>
struct std::is_error_code_enum<netrun::error_code> : std::true_type
{
};

template <>
struct fmt::formatter<netrun::error_code> : fmt::formatter<std::string_view>
{
    auto format(netrun::error_code const ec, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netrun::error_code_formatter::to_string(ec), ctx);
    }
};

template <>
struct fmt::formatter<netrun::error> : fmt::formatter<std::string_view>
{
    auto format(netrun::error const &e, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(e.message(), ctx);
    }
};
