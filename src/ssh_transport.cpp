// ssh_transport.cpp - libssh interactive shell transport
// network CLIs want a pty and a shell, not exec channels, so everything goes through one shell channel

#include "netrun/ssh_transport.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <mutex>
#include <span>
#include <string>

#include <libssh/libssh.h>

namespace netrun::ssh
{

    namespace
    {

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct channel_guard
        {
            ssh_channel channel{nullptr};

            channel_guard() = default;
            explicit channel_guard(ssh_channel c) : channel(c) {}
            ~channel_guard() { reset(); }

            channel_guard(channel_guard const &) = delete;
            auto operator=(channel_guard const &) -> channel_guard & = delete;

            channel_guard(channel_guard &&other) noexcept : channel(other.channel) { other.channel = nullptr; }

            auto operator=(channel_guard &&other) noexcept -> channel_guard &
            {
                if (this != &other)
                {
                    reset();
                    channel = other.channel;
                    other.channel = nullptr;
                }
                return *this;
            }

            auto reset() noexcept -> void
            {
                if (channel != nullptr)
                {
                    if (ssh_channel_is_open(channel) != 0)
                    {
                        ssh_channel_send_eof(channel);
                        ssh_channel_close(channel);
                    }
                    ssh_channel_free(channel);
                    channel = nullptr;
                }
            }

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel; }
            [[nodiscard]] explicit operator bool() const noexcept { return channel != nullptr; }
        };

        struct session_guard
        {
            ::ssh_session session{nullptr};

            session_guard() = default;
            explicit session_guard(::ssh_session s) : session(s) {}
            ~session_guard() { reset(); }

            session_guard(session_guard const &) = delete;
            auto operator=(session_guard const &) -> session_guard & = delete;
            session_guard(session_guard &&) = delete;
            auto operator=(session_guard &&) -> session_guard & = delete;

            auto reset() noexcept -> void
            {
                if (session != nullptr)
                {
                    if (ssh_is_connected(session) != 0)
                    {
                        ssh_disconnect(session);
                    }
                    ssh_free(session);
                    session = nullptr;
                }
            }

            [[nodiscard]] auto get() const noexcept -> ::ssh_session { return session; }
            [[nodiscard]] explicit operator bool() const noexcept { return session != nullptr; }
        };

        // libssh reports timeouts only through its error string
        [[nodiscard]] auto classify_connect_error(::ssh_session s) -> error
        {
            std::string const detail = ssh_get_error(s);
            auto const lowered = text::to_lower(detail);
            if (lowered.find("timeout") != std::string::npos || lowered.find("timed out") != std::string::npos)
            {
                return error{error_code::timeout, detail};
            }
            return error{error_code::connect_failed, detail};
        }

        std::once_flag g_libssh_init;

        // =============================================================================
        // shell session
        // =============================================================================

        class shell_session final : public transport_session
        {
        private:
            session_guard ssh_{};
            channel_guard channel_{};
            transport_config const &config_;
            std::string host_{};

        public:
            shell_session(::ssh_session s, transport_config const &config, std::string host)
                : ssh_{s}, config_{config}, host_{std::move(host)}
            {
            }

            ~shell_session() override { close(); }

            [[nodiscard]] auto authenticate(credentials const &creds, std::chrono::seconds timeout)
                -> void_result override
            {
                if (!ssh_)
                {
                    return std::unexpected{make_error(error_code::connect_failed, "{}: session closed", host_)};
                }

                auto timeout_secs = static_cast<long>(timeout.count());
                ssh_options_set(ssh_.get(), SSH_OPTIONS_TIMEOUT, &timeout_secs);

                if (!try_authenticate(creds))
                {
                    return std::unexpected{
                        make_error(error_code::auth_failed, "{}: {} rejected ({})", host_, creds, ssh_get_error(ssh_.get()))};
                }

                return open_shell();
            }

            [[nodiscard]] auto read_until(prompt_pattern const &expect, std::chrono::milliseconds timeout)
                -> result<std::string> override
            {
                if (!channel_)
                {
                    return std::unexpected{make_error(error_code::connect_failed, "{}: shell not open", host_)};
                }

                auto source = [this](std::span<char> buffer, std::chrono::milliseconds poll) -> result<std::size_t>
                {
                    auto const nbytes = ssh_channel_read_timeout(channel_.get(), buffer.data(),
                                                                 static_cast<std::uint32_t>(buffer.size()), 0,
                                                                 static_cast<int>(poll.count()));
                    if (nbytes == SSH_ERROR)
                    {
                        return std::unexpected{
                            make_error(error_code::connect_failed, "{}: read failed ({})", host_, ssh_get_error(ssh_.get()))};
                    }
                    if (nbytes == 0 && ssh_channel_is_eof(channel_.get()) != 0)
                    {
                        return std::unexpected{make_error(error_code::connect_failed, "{}: device closed the channel", host_)};
                    }
                    return nbytes > 0 ? static_cast<std::size_t>(nbytes) : std::size_t{0};
                };

                return netrun::read_until(source, expect, read_options{.timeout = timeout});
            }

            [[nodiscard]] auto send(std::string_view text, prompt_pattern const &expect,
                                    std::chrono::milliseconds timeout) -> result<std::string> override
            {
                if (!channel_)
                {
                    return std::unexpected{make_error(error_code::connect_failed, "{}: shell not open", host_)};
                }

                auto const line = fmt::format("{}\n", text);
                std::size_t offset = 0;
                while (offset < line.size())
                {
                    auto const written = ssh_channel_write(channel_.get(), line.data() + offset,
                                                           static_cast<std::uint32_t>(line.size() - offset));
                    if (written == SSH_ERROR)
                    {
                        return std::unexpected{
                            make_error(error_code::connect_failed, "{}: write failed ({})", host_, ssh_get_error(ssh_.get()))};
                    }
                    offset += static_cast<std::size_t>(written);
                }

                return read_until(expect, timeout);
            }

            auto close() noexcept -> void override
            {
                channel_.reset();
                ssh_.reset();
            }

            [[nodiscard]] auto is_open() const noexcept -> bool override
            {
                return ssh_ && ssh_is_connected(ssh_.get()) != 0 && channel_ &&
                       ssh_channel_is_open(channel_.get()) != 0;
            }

        private:
            [[nodiscard]] auto try_authenticate(credentials const &creds) -> bool
            {
                // explicit key first
                if (!config_.private_key_path.empty())
                {
                    ssh_key key = nullptr;
                    auto const *passphrase =
                        config_.private_key_passphrase.empty() ? nullptr : config_.private_key_passphrase.c_str();
                    auto rc = ssh_pki_import_privkey_file(config_.private_key_path.c_str(), passphrase, nullptr, nullptr, &key);
                    if (rc == SSH_OK && key != nullptr)
                    {
                        rc = ssh_userauth_publickey(ssh_.get(), nullptr, key);
                        ssh_key_free(key);
                        if (rc == SSH_AUTH_SUCCESS)
                        {
                            return true;
                        }
                    }
                }

                if (config_.try_agent_keys && ssh_userauth_publickey_auto(ssh_.get(), nullptr, nullptr) == SSH_AUTH_SUCCESS)
                {
                    return true;
                }

                if (creds.password.empty())
                {
                    return false;
                }

                if (ssh_userauth_password(ssh_.get(), nullptr, creds.password.c_str()) == SSH_AUTH_SUCCESS)
                {
                    return true;
                }

                // plenty of network gear only offers keyboard-interactive
                return try_keyboard_interactive(creds.password);
            }

            [[nodiscard]] auto try_keyboard_interactive(std::string const &password) -> bool
            {
                auto rc = ssh_userauth_kbdint(ssh_.get(), nullptr, nullptr);
                while (rc == SSH_AUTH_INFO)
                {
                    auto const prompts = ssh_userauth_kbdint_getnprompts(ssh_.get());
                    for (int i = 0; i < prompts; ++i)
                    {
                        if (ssh_userauth_kbdint_setanswer(ssh_.get(), static_cast<unsigned int>(i), password.c_str()) < 0)
                        {
                            return false;
                        }
                    }
                    rc = ssh_userauth_kbdint(ssh_.get(), nullptr, nullptr);
                }
                return rc == SSH_AUTH_SUCCESS;
            }

            [[nodiscard]] auto open_shell() -> void_result
            {
                channel_guard channel{ssh_channel_new(ssh_.get())};
                if (!channel)
                {
                    return std::unexpected{make_error(error_code::connect_failed, "{}: failed to allocate channel", host_)};
                }

                if (ssh_channel_open_session(channel.get()) != SSH_OK)
                {
                    return std::unexpected{
                        make_error(error_code::connect_failed, "{}: failed to open channel ({})", host_, ssh_get_error(ssh_.get()))};
                }

                if (ssh_channel_request_pty_size(channel.get(), "vt100", config_.terminal_width, config_.terminal_height) !=
                    SSH_OK)
                {
                    return std::unexpected{
                        make_error(error_code::connect_failed, "{}: pty request refused ({})", host_, ssh_get_error(ssh_.get()))};
                }

                if (ssh_channel_request_shell(channel.get()) != SSH_OK)
                {
                    return std::unexpected{
                        make_error(error_code::connect_failed, "{}: shell request refused ({})", host_, ssh_get_error(ssh_.get()))};
                }

                channel_ = std::move(channel);
                return {};
            }
        };

    } // namespace

    // =============================================================================
    // transport implementation
    // =============================================================================

    transport::transport(transport_config config) : config_{std::move(config)}
    {
        std::call_once(g_libssh_init, []
                       {
                           if (ssh_init() != SSH_OK)
                           {
                               spdlog::warn("ssh_init failed, libssh will initialise lazily");
                           } });
    }

    transport::~transport() = default;

    auto transport::connect(connect_request const &request) -> result<std::unique_ptr<transport_session>>
    {
        auto *raw = ssh_new();
        if (raw == nullptr)
        {
            return std::unexpected{make_error(error_code::connect_failed, "{}: ssh_new failed", request.address)};
        }
        auto session = std::make_unique<shell_session>(raw, config_, request.address);

        int const port = request.port;
        auto timeout_secs = static_cast<long>(request.timeout.count());

        ssh_options_set(raw, SSH_OPTIONS_HOST, request.address.c_str());
        ssh_options_set(raw, SSH_OPTIONS_PORT, &port);
        ssh_options_set(raw, SSH_OPTIONS_USER, request.username.c_str());
        ssh_options_set(raw, SSH_OPTIONS_TIMEOUT, &timeout_secs);

        if (config_.verbosity > 0)
        {
            int verbosity = SSH_LOG_PROTOCOL;
            ssh_options_set(raw, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);
        }

        if (!config_.strict_host_key_checking)
        {
            // accept any host key - lab and bulk-audit use only
            int strict = 0;
            ssh_options_set(raw, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
        }

        if (ssh_connect(raw) != SSH_OK)
        {
            auto err = classify_connect_error(raw);
            err.detail = fmt::format("{}:{}: {}", request.address, request.port, err.detail);
            return std::unexpected{std::move(err)};
        }

        if (config_.strict_host_key_checking && ssh_session_is_known_server(raw) != SSH_KNOWN_HOSTS_OK)
        {
            return std::unexpected{make_error(error_code::connect_failed, "{}: host key verification failed", request.address)};
        }

        spdlog::debug("ssh: connected to {}:{} ({})", request.address, request.port, request.device_type);
        return std::unique_ptr<transport_session>{std::move(session)};
    }

} // namespace netrun::ssh
