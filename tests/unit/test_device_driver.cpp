// tests/unit/test_device_driver.cpp - platform resolution, output cleanup and the CLI dialogue

#include "common/test_helpers.hpp"

#include "netrun/device_driver.hpp"
#include <doctest/doctest.h>

#include <algorithm>

using netrun::testing::device_script;
using netrun::testing::mock_transport;

namespace
{

    [[nodiscard]] auto open_session(mock_transport &link, std::string_view const type = "cisco_ios")
        -> netrun::driver_session
    {
        auto driver = netrun::resolve_driver(type);
        REQUIRE(driver.has_value());
        auto session = netrun::driver_session::connect(*driver, link, netrun::device{.address = "10.0.0.1"},
                                                       netrun::credentials{.username = "admin", .password = "pw"},
                                                       netrun::driver_timeouts{});
        REQUIRE(session.has_value());
        return std::move(*session);
    }

} // anonymous namespace

TEST_SUITE("resolve_driver")
{
    TEST_CASE("every supported tag resolves to itself")
    {
        auto const tags = netrun::supported_device_types();
        CHECK(tags.size() == 8);
        for (auto const tag : tags)
        {
            auto const driver = netrun::resolve_driver(tag);
            REQUIRE(driver.has_value());
            CHECK(netrun::traits_of(*driver).name == tag);
        }
    }

    TEST_CASE("tags are case and whitespace tolerant")
    {
        auto const driver = netrun::resolve_driver("  Cisco_ASA ");
        REQUIRE(driver.has_value());
        CHECK(std::holds_alternative<netrun::cisco_asa_driver>(*driver));
    }

    TEST_CASE("unknown tags are a validation error, never a fallback")
    {
        for (auto const tag : {"autodetect", "", "cisco_xr", "generic"})
        {
            auto const driver = netrun::resolve_driver(tag);
            REQUIRE_FALSE(driver.has_value());
            CHECK(driver.error().code == netrun::error_code::unsupported_device_type);
            CHECK(netrun::is_validation_error(driver.error().code));
        }
    }

    TEST_CASE("privilege escalation capability")
    {
        CHECK(netrun::supports_privilege_escalation(netrun::resolve_driver("cisco_ios").value()));
        CHECK(netrun::supports_privilege_escalation(netrun::resolve_driver("cisco_asa").value()));
        CHECK_FALSE(netrun::supports_privilege_escalation(netrun::resolve_driver("juniper_junos").value()));
        CHECK_FALSE(netrun::supports_privilege_escalation(netrun::resolve_driver("cisco_nxos").value()));
    }

    TEST_CASE("every prompt pattern compiles and matches a typical prompt")
    {
        std::vector<std::pair<std::string_view, std::string_view>> const samples{
            {"arista_eos", "leaf1#"},
            {"cisco_asa", "fw01>"},
            {"cisco_ios", "core-sw1#"},
            {"cisco_nxos", "n9k(config)#"},
            {"f5_tmsh", "root@(bigip1)(cfg-sync Standalone)(Active)(/Common)(tmos)# "},
            {"juniper_junos", "admin@mx1> "},
            {"linux", "admin@host:~$ "},
            {"paloalto_panos", "admin@PA-3220> "},
        };
        for (auto const &[tag, prompt] : samples)
        {
            CAPTURE(tag);
            auto const driver = netrun::resolve_driver(tag).value();
            netrun::prompt_pattern const pattern{netrun::traits_of(driver).prompt};
            CHECK(pattern.matches_tail(prompt));
        }
    }
}

TEST_SUITE("output_helpers")
{
    netrun::prompt_pattern const prompt{netrun::cisco_ios_driver::traits.prompt};

    TEST_CASE("normalize strips echo and trailing prompt")
    {
        auto const out = netrun::normalize_output("show clock\r\n*12:00:01.123 UTC Mon Jan 1 2024\r\n\r\nrouter#",
                                                  "show clock", prompt);
        CHECK(out == "*12:00:01.123 UTC Mon Jan 1 2024");
    }

    TEST_CASE("normalize keeps output that merely mentions the command")
    {
        auto const out = netrun::normalize_output("show ip int brief\r\nInterface  IP-Address\r\nGi0/1      10.0.0.1\r\nrouter#",
                                                  "show ip int brief", prompt);
        CHECK(out == "Interface  IP-Address\nGi0/1      10.0.0.1");
    }

    TEST_CASE("error markers")
    {
        CHECK(netrun::has_error_marker("              ^\n% Invalid input detected at '^' marker."));
        CHECK(netrun::has_error_marker("% Incomplete command."));
        CHECK(netrun::has_error_marker("bash: foo: command not found"));
        CHECK(netrun::has_error_marker("syntax error, expecting <command>."));
        CHECK(netrun::has_error_marker("% Bad IP address or host name"));
        CHECK_FALSE(netrun::has_error_marker("Cisco IOS Software, Version 15.2(4)M"));
        CHECK_FALSE(netrun::has_error_marker(""));
    }

    TEST_CASE("log messages in a reply are not errors")
    {
        CHECK_FALSE(netrun::has_error_marker("%LINK-3-UPDOWN: Interface GigabitEthernet0/1, changed state to down"));
        CHECK_FALSE(netrun::has_error_marker(
            "*Mar  1 00:01:02.123: %LINEPROTO-5-UPDOWN: Line protocol on Interface Gi0/1, changed state to up"));
        CHECK_FALSE(netrun::has_error_marker("000042: %SYS-5-CONFIG_I: Configured from console by admin on vty0"));

        // a real complaint next to a log line still counts
        CHECK(netrun::has_error_marker("%LINK-3-UPDOWN: Interface Gi0/1, changed state to up\n"
                                       "% Invalid input detected at '^' marker."));
        CHECK(netrun::has_error_marker("%SYS-5-CONFIG_I: Configured from console\n% Incomplete command."));
    }
}

TEST_SUITE("driver_session")
{
    TEST_CASE("send_command returns the clean body")
    {
        mock_transport link;
        link.script_default(device_script{.outputs = {{"show version", "IOS 15.2\r\nuptime 3 weeks"}}});

        auto session = open_session(link);
        REQUIRE(session.login(netrun::credentials{.username = "admin", .password = "pw"}).has_value());
        REQUIRE(session.prepare_terminal().has_value());

        auto const out = session.send_command("show version");
        REQUIRE(out.has_value());
        CHECK(*out == "IOS 15.2\nuptime 3 weeks");
        CHECK(link.times_sent("terminal length 0") == 1);
    }

    TEST_CASE("rejected input is a command failure carrying the device output")
    {
        mock_transport link;
        link.script_default(device_script{.rejected = {"show bogus"}});

        auto session = open_session(link);
        auto const out = session.send_command("show bogus");
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == netrun::error_code::command_failed);
        CHECK(out.error().detail.find("Invalid input") != std::string::npos);
    }

    TEST_CASE("privileged mode with the right secret")
    {
        mock_transport link;
        link.script_default(device_script{.enable_secret = "s3cret"});

        auto session = open_session(link);
        REQUIRE(session.login(netrun::credentials{.username = "admin", .password = "pw"}).has_value());
        CHECK(session.enter_privileged_mode("s3cret").has_value());
    }

    TEST_CASE("a wrong secret is an auth failure")
    {
        mock_transport link;
        link.script_default(device_script{.enable_secret = "s3cret"});

        auto session = open_session(link);
        auto const escalated = session.enter_privileged_mode("guess");
        REQUIRE_FALSE(escalated.has_value());
        CHECK(escalated.error().code == netrun::error_code::auth_failed);
    }

    TEST_CASE("already privileged sessions skip the password")
    {
        mock_transport link;
        auto session = open_session(link);
        CHECK(session.enter_privileged_mode("unused").has_value());
        CHECK(link.times_sent("unused") == 0);
    }

    TEST_CASE("config mode commands follow the platform")
    {
        mock_transport link;
        auto session = open_session(link);
        REQUIRE(session.enter_config_mode().has_value());
        REQUIRE(session.exit_config_mode().has_value());
        CHECK(link.times_sent("configure terminal") == 1);
        CHECK(link.times_sent("end") == 1);
    }

    TEST_CASE("a log message echoed during a config command is not a rejection")
    {
        mock_transport link;
        link.script_default(device_script{
            .outputs = {{"no shutdown", "*Mar  1 00:01:02.123: %LINK-3-UPDOWN: Interface Gi0/1, changed state to up"}}});

        auto session = open_session(link);
        REQUIRE(session.enter_config_mode().has_value());
        auto const out = session.send_command("no shutdown");
        REQUIRE(out.has_value());
        CHECK(out->find("%LINK-3-UPDOWN") != std::string::npos);
    }

    TEST_CASE("connect errors pass through untouched")
    {
        mock_transport link;
        link.script_default(device_script{
            .connect_error = netrun::error{netrun::error_code::timeout, "no route"}});

        auto const driver = netrun::resolve_driver("cisco_ios").value();
        auto const session = netrun::driver_session::connect(driver, link, netrun::device{.address = "10.9.9.9"},
                                                             netrun::credentials{.username = "admin"}, {});
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error().code == netrun::error_code::timeout);
    }
}
