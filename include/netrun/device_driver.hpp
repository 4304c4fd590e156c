#pragma once

// device_driver.hpp - per-platform CLI behaviour, resolved once per device
// the set of platforms is closed: an unknown tag is a validation error, not a fallback

#include "common.hpp"
#include "device.hpp"
#include "prompt_reader.hpp"
#include "transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace netrun
{

    // ============================================================================
    // driver traits - the strings that differ between platforms
    // ============================================================================

    struct driver_traits
    {
        std::string_view name{};
        std::string_view prompt{};           // regex matched against the last output line
        std::string_view pager_off{};        // sent once the session is ready, empty if none
        std::string_view escalate_command{}; // empty when the platform has no privileged mode
        std::string_view escalate_prompt{};  // password prompt shown after escalate_command
        std::string_view config_enter{};     // empty when commands apply without a config context
        std::string_view config_exit{};
    };

    struct driver_timeouts
    {
        std::chrono::seconds connect{30};
        std::chrono::seconds command{120};
    };

    // ============================================================================
    // platforms
    // ============================================================================

    struct arista_eos_driver
    {
        static constexpr driver_traits traits{
            .name = "arista_eos",
            .prompt = R"([\w.\-()/:]+[>#]\s*$)",
            .pager_off = "terminal length 0",
            .escalate_command = "enable",
            .escalate_prompt = R"([Pp]assword:\s*$)",
            .config_enter = "configure terminal",
            .config_exit = "end",
        };
    };

    struct cisco_asa_driver
    {
        static constexpr driver_traits traits{
            .name = "cisco_asa",
            .prompt = R"([\w.\-/()]+[>#]\s*$)",
            .pager_off = "terminal pager 0",
            .escalate_command = "enable",
            .escalate_prompt = R"([Pp]assword:\s*$)",
            .config_enter = "configure terminal",
            .config_exit = "end",
        };
    };

    struct cisco_ios_driver
    {
        static constexpr driver_traits traits{
            .name = "cisco_ios",
            .prompt = R"([\w.\-]+(\(config[\w.\-]*\))?[>#]\s*$)",
            .pager_off = "terminal length 0",
            .escalate_command = "enable",
            .escalate_prompt = R"([Pp]assword:\s*$)",
            .config_enter = "configure terminal",
            .config_exit = "end",
        };
    };

    struct cisco_nxos_driver
    {
        static constexpr driver_traits traits{
            .name = "cisco_nxos",
            .prompt = R"([\w.\-]+(\(config[\w.\-]*\))?#\s*$)",
            .pager_off = "terminal length 0",
            .escalate_command = {},
            .escalate_prompt = {},
            .config_enter = "configure terminal",
            .config_exit = "end",
        };
    };

    struct f5_tmsh_driver
    {
        static constexpr driver_traits traits{
            .name = "f5_tmsh",
            .prompt = R"([\w.\-@()/ ]*[#>]\s*$)",
            .pager_off = "modify cli preference pager disabled display-threshold 0",
            .escalate_command = {},
            .escalate_prompt = {},
            .config_enter = {},
            .config_exit = {},
        };
    };

    struct juniper_junos_driver
    {
        static constexpr driver_traits traits{
            .name = "juniper_junos",
            .prompt = R"([\w.\-]+@[\w.\-]+[>#%]\s*$)",
            .pager_off = "set cli screen-length 0",
            .escalate_command = {},
            .escalate_prompt = {},
            .config_enter = "configure",
            .config_exit = "commit and-quit",
        };
    };

    struct linux_driver
    {
        static constexpr driver_traits traits{
            .name = "linux",
            .prompt = R"([\w.\-@:~/\[\] ]*[$#]\s*$)",
            .pager_off = "export PAGER=cat",
            .escalate_command = "sudo -s",
            .escalate_prompt = R"([Pp]assword[^:]*:\s*$)",
            .config_enter = {},
            .config_exit = {},
        };
    };

    struct paloalto_panos_driver
    {
        static constexpr driver_traits traits{
            .name = "paloalto_panos",
            .prompt = R"([\w.\-]+@[\w.\-()]+[>#]\s*$)",
            .pager_off = "set cli pager off",
            .escalate_command = {},
            .escalate_prompt = {},
            .config_enter = "configure",
            .config_exit = "exit",
        };
    };

    using device_driver = std::variant<arista_eos_driver, cisco_asa_driver, cisco_ios_driver, cisco_nxos_driver,
                                       f5_tmsh_driver, juniper_junos_driver, linux_driver, paloalto_panos_driver>;

    // errors: unsupported_device_type
    [[nodiscard]] auto resolve_driver(std::string_view device_type) -> result<device_driver>;

    [[nodiscard]] auto traits_of(device_driver const &driver) noexcept -> driver_traits const &;

    [[nodiscard]] auto supported_device_types() -> std::vector<std::string_view>;

    [[nodiscard]] auto supports_privilege_escalation(device_driver const &driver) noexcept -> bool;

    // ============================================================================
    // capability set - connect, send_command, enter_privileged_mode
    // ============================================================================

    class driver_session
    {
    private:
        device_driver driver_;
        std::unique_ptr<transport_session> session_;
        prompt_pattern prompt_;
        prompt_pattern escalate_prompt_;
        driver_timeouts timeouts_;

    public:
        driver_session(device_driver driver, std::unique_ptr<transport_session> session, driver_timeouts timeouts);

        driver_session(driver_session const &) = delete;
        auto operator=(driver_session const &) -> driver_session & = delete;
        driver_session(driver_session &&) noexcept = default;
        auto operator=(driver_session &&) noexcept -> driver_session & = default;
        ~driver_session() = default;

        // opens the transport connection, nothing is authenticated yet
        // errors: connect_failed, timeout
        [[nodiscard]] static auto connect(device_driver const &driver, transport &link, device const &dev,
                                          credentials const &creds, driver_timeouts timeouts)
            -> result<driver_session>;

        // authenticates and waits for the first prompt
        // errors: auth_failed, timeout, connect_failed
        [[nodiscard]] auto login(credentials const &creds) -> void_result;

        // any failure here is an auth_failed: wrong secret, refusal or a device that never answers
        [[nodiscard]] auto enter_privileged_mode(std::string_view secret) -> void_result;

        // turns paging off so long outputs do not stall on --More--
        [[nodiscard]] auto prepare_terminal() -> void_result;

        // output has the echo and the trailing prompt stripped
        // errors: command_failed (device rejected the command, detail is its output), timeout, connect_failed
        [[nodiscard]] auto send_command(std::string_view command) -> result<std::string>;

        [[nodiscard]] auto enter_config_mode() -> void_result;

        [[nodiscard]] auto exit_config_mode() -> void_result;

        auto close() noexcept -> void;

        [[nodiscard]] auto traits() const noexcept -> driver_traits const & { return traits_of(driver_); }

    private:
        [[nodiscard]] auto command_timeout() const noexcept -> std::chrono::milliseconds
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(timeouts_.command);
        }
    };

    // ============================================================================
    // output helpers - exposed for testing
    // ============================================================================

    // removes the echoed command line and the trailing prompt line
    [[nodiscard]] auto normalize_output(std::string_view raw, std::string_view command, prompt_pattern const &prompt)
        -> std::string;

    // true when the output carries one of the error markers CLIs print for rejected input
    [[nodiscard]] auto has_error_marker(std::string_view output) -> bool;

} // namespace netrun
