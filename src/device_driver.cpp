// device_driver.cpp - platform resolution and the shared CLI dialogue

#include "netrun/device_driver.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <regex>
#include <utility>

namespace netrun
{

    namespace
    {

        // lower-cased markers CLIs print when they reject input
        constexpr std::array<std::string_view, 14> error_markers{
            "% invalid input detected",
            "% unknown command",
            "% incomplete command",
            "% ambiguous command",
            "% error",
            "% invalid command",
            "invalid command",
            "-ash: invalid",
            "command not found",
            "not found",
            "syntax error",
            "unknown command",
            "incomplete command",
            "ambiguous command",
        };

        // IOS style log message, e.g. "*Mar  1 00:01:02.123: %LINK-3-UPDOWN: Interface Gi0/1, changed state to down"
        [[nodiscard]] auto is_syslog_line(std::string_view const line) -> bool
        {
            static std::regex const facility{R"(%[A-Z0-9_]+-[0-7]-[A-Z0-9_]+:)", std::regex::ECMAScript | std::regex::optimize};
            return std::regex_search(line.begin(), line.end(), facility);
        }

        template <typename Driver>
        [[nodiscard]] constexpr auto tag_of() noexcept -> std::string_view
        {
            return Driver::traits.name;
        }

        template <std::size_t I = 0>
        [[nodiscard]] auto make_driver(std::string_view const tag) -> std::optional<device_driver>
        {
            if constexpr (I < std::variant_size_v<device_driver>)
            {
                using candidate = std::variant_alternative_t<I, device_driver>;
                if (tag == tag_of<candidate>())
                {
                    return device_driver{std::in_place_index<I>};
                }
                return make_driver<I + 1>(tag);
            }
            else
            {
                return std::nullopt;
            }
        }

        template <std::size_t... I>
        [[nodiscard]] auto all_tags(std::index_sequence<I...>) -> std::vector<std::string_view>
        {
            return {tag_of<std::variant_alternative_t<I, device_driver>>()...};
        }

        [[nodiscard]] auto privileged_prompt(std::string_view const line) noexcept -> bool
        {
            auto const trimmed = text::trim(line);
            return !trimmed.empty() && trimmed.back() == '#';
        }

    } // namespace

    // ============================================================================
    // resolution
    // ============================================================================

    auto resolve_driver(std::string_view const device_type) -> result<device_driver>
    {
        auto const tag = text::to_lower(text::trim(device_type));
        if (auto driver = make_driver(tag); driver.has_value())
        {
            return *driver;
        }
        return std::unexpected{make_error(error_code::unsupported_device_type, "'{}' (supported: {})", device_type,
                                          fmt::join(supported_device_types(), ", "))};
    }

    auto traits_of(device_driver const &driver) noexcept -> driver_traits const &
    {
        return std::visit([](auto const &d) -> driver_traits const & { return std::decay_t<decltype(d)>::traits; },
                          driver);
    }

    auto supported_device_types() -> std::vector<std::string_view>
    {
        return all_tags(std::make_index_sequence<std::variant_size_v<device_driver>>{});
    }

    auto supports_privilege_escalation(device_driver const &driver) noexcept -> bool
    {
        return !traits_of(driver).escalate_command.empty();
    }

    // ============================================================================
    // driver_session
    // ============================================================================

    driver_session::driver_session(device_driver driver, std::unique_ptr<transport_session> session,
                                   driver_timeouts timeouts)
        : driver_{driver}, session_{std::move(session)}, prompt_{traits_of(driver).prompt},
          escalate_prompt_{traits_of(driver).escalate_prompt}, timeouts_{timeouts}
    {
    }

    auto driver_session::connect(device_driver const &driver, transport &link, device const &dev,
                                 credentials const &creds, driver_timeouts timeouts) -> result<driver_session>
    {
        connect_request request{
            .address = dev.address,
            .port = dev.port,
            .username = creds.username,
            .device_type = std::string{traits_of(driver).name},
            .timeout = timeouts.connect,
        };

        auto session = link.connect(request);
        if (!session.has_value())
        {
            return std::unexpected{session.error()};
        }
        if (*session == nullptr)
        {
            return std::unexpected{make_error(error_code::internal_fault, "{}: transport returned no session", dev.label())};
        }

        return driver_session{driver, std::move(*session), timeouts};
    }

    auto driver_session::login(credentials const &creds) -> void_result
    {
        auto auth = session_->authenticate(creds, timeouts_.connect);
        if (!auth.has_value())
        {
            return auth;
        }

        // banner and motd arrive before the first prompt
        auto banner = session_->read_until(prompt_, std::chrono::duration_cast<std::chrono::milliseconds>(timeouts_.connect));
        if (!banner.has_value())
        {
            return std::unexpected{banner.error()};
        }
        return {};
    }

    auto driver_session::enter_privileged_mode(std::string_view const secret) -> void_result
    {
        auto const &t = traits();
        if (t.escalate_command.empty())
        {
            return {};
        }

        // either a password prompt, or straight back to a prompt when already privileged
        prompt_pattern const either{fmt::format("(?:{})|(?:{})", t.escalate_prompt, t.prompt)};

        auto reply = session_->send(t.escalate_command, either, command_timeout());
        if (!reply.has_value())
        {
            return std::unexpected{make_error(error_code::auth_failed, "'{}' failed: {}", t.escalate_command,
                                              reply.error().message())};
        }

        if (escalate_prompt_.matches_tail(*reply))
        {
            reply = session_->send(secret, prompt_, command_timeout());
            if (!reply.has_value())
            {
                // a wrong secret usually re-prompts for the password until the device gives up
                return std::unexpected{make_error(error_code::auth_failed, "{} rejected the elevation secret: {}",
                                                  t.escalate_command, reply.error().detail)};
            }
        }

        if (!privileged_prompt(last_line(*reply)))
        {
            return std::unexpected{make_error(error_code::auth_failed, "still unprivileged after '{}' (prompt '{}')",
                                              t.escalate_command, text::trim(last_line(*reply)))};
        }
        return {};
    }

    auto driver_session::prepare_terminal() -> void_result
    {
        auto const &t = traits();
        if (t.pager_off.empty())
        {
            return {};
        }

        auto reply = session_->send(t.pager_off, prompt_, command_timeout());
        if (!reply.has_value())
        {
            return std::unexpected{reply.error()};
        }
        if (has_error_marker(normalize_output(*reply, t.pager_off, prompt_)))
        {
            // unprivileged ASA sessions refuse the pager command; output may page but still arrives
            spdlog::debug("{}: '{}' rejected, continuing with paging enabled", t.name, t.pager_off);
        }
        return {};
    }

    auto driver_session::send_command(std::string_view const command) -> result<std::string>
    {
        auto reply = session_->send(command, prompt_, command_timeout());
        if (!reply.has_value())
        {
            return std::unexpected{reply.error()};
        }

        auto output = normalize_output(*reply, command, prompt_);
        if (has_error_marker(output))
        {
            return std::unexpected{error{error_code::command_failed, std::move(output)}};
        }
        return output;
    }

    auto driver_session::enter_config_mode() -> void_result
    {
        auto const &t = traits();
        if (t.config_enter.empty())
        {
            return {};
        }

        auto reply = send_command(t.config_enter);
        if (!reply.has_value())
        {
            return std::unexpected{reply.error()};
        }
        return {};
    }

    auto driver_session::exit_config_mode() -> void_result
    {
        auto const &t = traits();
        if (t.config_exit.empty())
        {
            return {};
        }

        auto reply = send_command(t.config_exit);
        if (!reply.has_value())
        {
            return std::unexpected{reply.error()};
        }
        return {};
    }

    auto driver_session::close() noexcept -> void
    {
        if (session_)
        {
            session_->close();
        }
    }

    // ============================================================================
    // output helpers
    // ============================================================================

    auto normalize_output(std::string_view const raw, std::string_view const command, prompt_pattern const &prompt)
        -> std::string
    {
        auto lines = text::split_lines(raw);

        // trailing prompt
        while (!lines.empty() && (text::trim(lines.back()).empty() || prompt.matches_line(lines.back())))
        {
            lines.pop_back();
        }

        // command echo, possibly behind a prompt on the same line
        auto const trimmed_command = text::trim(command);
        if (!lines.empty() && !trimmed_command.empty() && lines.front().find(trimmed_command) != std::string_view::npos)
        {
            lines.erase(lines.begin());
        }

        while (!lines.empty() && text::trim(lines.front()).empty())
        {
            lines.erase(lines.begin());
        }

        return fmt::format("{}", fmt::join(lines, "\n"));
    }

    auto has_error_marker(std::string_view const output) -> bool
    {
        // unsolicited log messages are not part of the reply
        auto lines = text::split_lines(output);
        std::erase_if(lines, [](std::string_view const line) { return is_syslog_line(line); });

        for (auto const line : lines)
        {
            auto const lowered = text::to_lower(line);
            auto const hit = std::any_of(error_markers.begin(), error_markers.end(), [&](std::string_view const marker)
                                         { return lowered.find(marker) != std::string::npos; });
            if (hit)
            {
                return true;
            }
        }

        // a one or two line reply that starts with '%' is a complaint on most platforms
        if (lines.size() <= 2)
        {
            return std::any_of(lines.begin(), lines.end(), [](std::string_view const line)
                               {
                                   auto const trimmed = text::trim(line);
                                   return !trimmed.empty() && trimmed.front() == '%'; });
        }
        return false;
    }

} // namespace netrun
