// tests/integration/test_ssh_transport.cpp - live SSH sessions against a lab device
// set NETRUN_TEST_SSH_HOST (and _USER, _PASSWORD, optionally _TYPE and _PORT) to run these;
// without a host every test here is skipped

#include "netrun/device_driver.hpp"
#include "netrun/scheduler.hpp"
#include "netrun/session_machine.hpp"
#include "netrun/ssh_transport.hpp"
#include <doctest/doctest.h>

#include <charconv>
#include <cstdlib>
#include <string>

namespace
{

    [[nodiscard]] auto env_or(char const *name, std::string fallback) -> std::string
    {
        auto const *value = std::getenv(name);
        return value != nullptr ? std::string{value} : std::move(fallback);
    }

    [[nodiscard]] auto lab_configured() noexcept -> bool
    {
        auto const *host = std::getenv("NETRUN_TEST_SSH_HOST");
        return host != nullptr && *host != '\0';
    }

    [[nodiscard]] auto lab_port() -> std::uint16_t
    {
        auto const text = env_or("NETRUN_TEST_SSH_PORT", "22");
        std::uint16_t port = 22;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        return ec == std::errc{} && ptr == text.data() + text.size() ? port : std::uint16_t{22};
    }

    [[nodiscard]] auto lab_unit(std::vector<std::string> commands) -> netrun::execution_unit
    {
        auto const type = env_or("NETRUN_TEST_SSH_TYPE", "linux");
        auto driver = netrun::resolve_driver(type);
        REQUIRE(driver.has_value());
        return netrun::execution_unit{
            .index = 0,
            .target = netrun::device{.address = env_or("NETRUN_TEST_SSH_HOST", ""), .dns = "lab",
                                     .device_type = type, .credential_profile = {}, .port = lab_port()},
            .commands = netrun::command_set{.commands = std::move(commands), .mode = netrun::execution_mode::normal},
            .creds = netrun::credentials{.username = env_or("NETRUN_TEST_SSH_USER", ""),
                                         .password = env_or("NETRUN_TEST_SSH_PASSWORD", ""),
                                         .elevation_secret = {}},
            .driver = *driver,
        };
    }

    [[nodiscard]] auto lab_config() -> netrun::run_config
    {
        return netrun::run_config{
            .max_workers = 2,
            .batch_size = 2,
            .connect_timeout = std::chrono::seconds{10},
            .command_timeout = std::chrono::seconds{10},
            .retry_count = 0,
            .retry_delay = std::chrono::milliseconds{100},
            .mode = netrun::execution_mode::normal,
        };
    }

} // anonymous namespace

TEST_SUITE("ssh_integration" * doctest::skip(!lab_configured()))
{
    TEST_CASE("one device, one session")
    {
        netrun::ssh::transport link;
        netrun::run_context const ctx{lab_config()};
        netrun::session_machine machine{link, ctx};

        auto const outcome = machine.run(lab_unit({"echo netrun-probe"}));
        REQUIRE(outcome.results.size() == 1);
        CHECK(outcome.terminal == netrun::session_state::terminal_success);
        CHECK(outcome.results[0].output.find("netrun-probe") != std::string::npos);
    }

    TEST_CASE("wrong password is an auth failure and is not retried")
    {
        netrun::ssh::transport link;
        auto cfg = lab_config();
        cfg.retry_count = 2;
        netrun::run_context const ctx{cfg};
        netrun::session_machine machine{link, ctx};

        auto unit = lab_unit({"echo never"});
        unit.creds.password = "definitely-not-the-password";

        auto const outcome = machine.run(unit);
        CHECK(outcome.terminal == netrun::session_state::terminal_failure);
        CHECK(outcome.attempts == 1);
        REQUIRE(outcome.results.size() == 1);
        CHECK(outcome.results[0].failure == netrun::failure_kind::auth);
    }

    TEST_CASE("closed port is a connect failure")
    {
        netrun::ssh::transport link;
        netrun::run_context const ctx{lab_config()};
        netrun::session_machine machine{link, ctx};

        auto unit = lab_unit({"echo never"});
        unit.target.port = 1;

        auto const outcome = machine.run(unit);
        REQUIRE(outcome.results.size() == 1);
        CHECK(outcome.results[0].failure == netrun::failure_kind::connect);
    }

    TEST_CASE("scheduler over real sessions")
    {
        netrun::ssh::transport link;
        netrun::run_context const ctx{lab_config()};
        netrun::batch_scheduler scheduler{link, ctx};

        std::vector<netrun::execution_unit> units;
        for (std::size_t i = 0; i < 3; ++i)
        {
            auto unit = lab_unit({"echo one", "echo two"});
            unit.index = i;
            units.push_back(std::move(unit));
        }

        auto const report = scheduler.run(units);
        REQUIRE(report.has_value());
        CHECK(report->complete());
        CHECK(report->counters.succeeded == 6);
    }
}
