#pragma once

// ssh_transport.hpp - interactive shell transport on top of libssh
// one libssh session + one pty shell channel per device

#include "transport.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace netrun::ssh
{

    struct transport_config
    {
        std::filesystem::path private_key_path{}; // optional, password auth otherwise
        std::string private_key_passphrase{};     // optional
        bool strict_host_key_checking{false};     // set true for production
        bool try_agent_keys{false};               // ssh-agent / default identities before password
        int verbosity{0};                         // 0=quiet, 1+=libssh protocol log
        int terminal_width{511};
        int terminal_height{0}; // 0 asks most CLIs not to page
    };

    // ============================================================================
    // ssh transport - thread-safe factory, every session is independent
    // ============================================================================

    class transport final : public netrun::transport
    {
    private:
        transport_config config_{};

    public:
        explicit transport(transport_config config = {});
        ~transport() override;

        [[nodiscard]] auto connect(connect_request const &request)
            -> result<std::unique_ptr<transport_session>> override;

        [[nodiscard]] auto config() const noexcept -> transport_config const & { return config_; }
    };

} // namespace netrun::ssh
