#pragma once

// transport.hpp - the capability the engine needs from an interactive CLI transport
// the engine never speaks SSH itself; ssh_transport.hpp is the libssh-backed implementation

#include "common.hpp"
#include "device.hpp"
#include "prompt_reader.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace netrun
{

    struct connect_request
    {
        std::string address{};
        std::uint16_t port{22};
        std::string username{};
        std::string device_type{};
        std::chrono::seconds timeout{30};
    };

    // ============================================================================
    // transport session - one live connection to one device
    // ============================================================================

    class transport_session
    {
    public:
        transport_session() = default;
        virtual ~transport_session() = default;

        transport_session(transport_session const &) = delete;
        auto operator=(transport_session const &) -> transport_session & = delete;
        transport_session(transport_session &&) = delete;
        auto operator=(transport_session &&) -> transport_session & = delete;

        // credentials accepted and an interactive shell granted
        // errors: auth_failed, timeout, connect_failed
        [[nodiscard]] virtual auto authenticate(credentials const &creds, std::chrono::seconds timeout)
            -> void_result = 0;

        // reads whatever the device prints until `expect` matches (banner, first prompt)
        [[nodiscard]] virtual auto read_until(prompt_pattern const &expect, std::chrono::milliseconds timeout)
            -> result<std::string> = 0;

        // writes `text` plus a line terminator, then reads until `expect` matches
        // the returned output is raw: echo and trailing prompt included
        [[nodiscard]] virtual auto send(std::string_view text, prompt_pattern const &expect,
                                        std::chrono::milliseconds timeout) -> result<std::string> = 0;

        virtual auto close() noexcept -> void = 0;

        [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
    };

    // ============================================================================
    // transport - session factory shared by every worker
    // ============================================================================

    class transport
    {
    public:
        transport() = default;
        virtual ~transport() = default;

        transport(transport const &) = delete;
        auto operator=(transport const &) -> transport & = delete;
        transport(transport &&) = delete;
        auto operator=(transport &&) -> transport & = delete;

        // must be safe to call from several workers at once
        // errors: connect_failed, timeout
        [[nodiscard]] virtual auto connect(connect_request const &request)
            -> result<std::unique_ptr<transport_session>> = 0;
    };

} // namespace netrun
