// tests/unit/test_prompt_reader.cpp - prompt matching and the read loop

#include "netrun/device.hpp"
#include "netrun/prompt_reader.hpp"
#include <doctest/doctest.h>

#include <algorithm>
#include <deque>
#include <span>
#include <string>

namespace
{

    // hands out canned chunks, then reports idle polls
    [[nodiscard]] auto scripted(std::deque<std::string> chunks) -> netrun::chunk_source
    {
        return [chunks = std::move(chunks)](std::span<char> buffer, std::chrono::milliseconds) mutable
                   -> netrun::result<std::size_t>
        {
            if (chunks.empty())
            {
                return std::size_t{0};
            }
            auto chunk = std::move(chunks.front());
            chunks.pop_front();
            auto const n = std::min(chunk.size(), buffer.size());
            std::copy_n(chunk.begin(), n, buffer.begin());
            return n;
        };
    }

    netrun::prompt_pattern const ios_prompt{R"([\w.\-]+(\(config[\w.\-]*\))?[>#]\s*$)"};

} // anonymous namespace

TEST_SUITE("prompt_pattern")
{
    TEST_CASE("matches only the last line")
    {
        CHECK(ios_prompt.matches_tail("show clock\r\n12:00:00\r\nrouter#"));
        CHECK(ios_prompt.matches_tail("router(config-if)# "));
        CHECK_FALSE(ios_prompt.matches_tail("router#\r\nstill printing"));
        CHECK_FALSE(netrun::prompt_pattern{}.matches_tail("router#"));
    }

    TEST_CASE("last_line ignores trailing terminators")
    {
        CHECK(netrun::last_line("a\r\nb\r\n") == "b");
        CHECK(netrun::last_line("single") == "single");
        CHECK(netrun::last_line("").empty());
    }
}

TEST_SUITE("read_until")
{
    TEST_CASE("collects chunks until the prompt shows up")
    {
        auto const out = netrun::read_until(scripted({"show ver", "sion\r\nIOS 15.2\r\n", "rout", "er#"}), ios_prompt,
                                            {.timeout = std::chrono::seconds{1}, .poll_interval = std::chrono::milliseconds{1}});
        REQUIRE(out.has_value());
        CHECK(*out == "show version\r\nIOS 15.2\r\nrouter#");
    }

    TEST_CASE("deadline gives a timeout carrying the last line")
    {
        auto const out = netrun::read_until(scripted({"copy run start\r\nDestination filename [startup-config]? "}),
                                            ios_prompt,
                                            {.timeout = std::chrono::milliseconds{30}, .poll_interval = std::chrono::milliseconds{5}});
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == netrun::error_code::timeout);
        CHECK(out.error().detail.find("Destination filename") != std::string::npos);
    }

    TEST_CASE("source errors pass through")
    {
        netrun::chunk_source const broken = [](std::span<char>, std::chrono::milliseconds) -> netrun::result<std::size_t>
        { return std::unexpected{netrun::error{netrun::error_code::connect_failed, "channel closed"}}; };

        auto const out = netrun::read_until(broken, ios_prompt);
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == netrun::error_code::connect_failed);
    }

    TEST_CASE("runaway output is cut off and ends the session")
    {
        netrun::chunk_source const flood = [](std::span<char> buffer, std::chrono::milliseconds) -> netrun::result<std::size_t>
        {
            std::fill(buffer.begin(), buffer.end(), 'x');
            return buffer.size();
        };

        auto const out = netrun::read_until(flood, ios_prompt, {.timeout = std::chrono::seconds{5}, .max_bytes = 64 * 1024});
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == netrun::error_code::timeout);
        CHECK(netrun::failure_kind_of(out.error().code) == netrun::failure_kind::timeout);
        CHECK(out.error().detail.find("65536 bytes") != std::string::npos);
    }
}
