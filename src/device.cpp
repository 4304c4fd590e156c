// device.cpp - device identity and result helpers

#include "netrun/device.hpp"

namespace netrun
{

    auto to_string(execution_mode const mode) noexcept -> std::string_view
    {
        switch (mode)
        {
        case execution_mode::normal:
            return "normal";
        case execution_mode::config:
            return "config";
        }
        return "unknown";
    }

    auto parse_execution_mode(std::string_view const str) -> result<execution_mode>
    {
        auto const lowered = text::to_lower(text::trim(str));
        if (lowered == "normal")
        {
            return execution_mode::normal;
        }
        if (lowered == "config")
        {
            return execution_mode::config;
        }
        return std::unexpected{make_error(error_code::invalid_config, "unknown mode '{}'", str)};
    }

    auto to_string(command_status const status) noexcept -> std::string_view
    {
        switch (status)
        {
        case command_status::success:
            return "success";
        case command_status::failure:
            return "failure";
        case command_status::skipped:
            return "skipped";
        case command_status::cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    auto to_string(failure_kind const kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case failure_kind::connect:
            return "connect";
        case failure_kind::auth:
            return "auth";
        case failure_kind::timeout:
            return "timeout";
        case failure_kind::command:
            return "command";
        case failure_kind::cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    auto failure_kind_of(error_code const ec) noexcept -> failure_kind
    {
        switch (ec)
        {
        case error_code::auth_failed:
            return failure_kind::auth;
        case error_code::timeout:
            return failure_kind::timeout;
        case error_code::command_failed:
            return failure_kind::command;
        case error_code::cancelled:
            return failure_kind::cancelled;
        default:
            // anything else the transport reports happened before a usable session existed
            return failure_kind::connect;
        }
    }

    auto device::label() const -> std::string
    {
        if (dns.empty())
        {
            return address;
        }
        return fmt::format("{} ({})", address, dns);
    }

    auto device::key() const -> std::string
    {
        return fmt::format("{}|{}", address, dns);
    }

} // namespace netrun
