// netrun.cpp - run a command list against every device of a CSV table
// ctrl-c cancels, SIGUSR1 pauses before the next device, SIGUSR2 resumes

#include "netrun/credentials.hpp"
#include "netrun/device_driver.hpp"
#include "netrun/device_table.hpp"
#include "netrun/execution_unit.hpp"
#include "netrun/logging.hpp"
#include "netrun/progress.hpp"
#include "netrun/report_export.hpp"
#include "netrun/run_context.hpp"
#include "netrun/scheduler.hpp"
#include "netrun/ssh_transport.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <spdlog/spdlog.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <pthread.h>
#include <termios.h>
#include <unistd.h>

namespace
{

    namespace exit_status
    {
        constexpr int ok = 0;
        constexpr int device_failures = 1;
        constexpr int fatal = 2;
    } // namespace exit_status

    // =============================================================================
    // configuration
    // =============================================================================

    struct cli_options
    {
        std::filesystem::path devices_file;
        netrun::run_config run{};

        std::string device_type{"cisco_ios"};
        std::string username;
        std::uint16_t port{22};
        bool escalate{false};

        std::filesystem::path output_dir{"output"};
        netrun::export_format format{netrun::export_format::csv};

        std::filesystem::path key_path;
        bool strict_host_key{false};

        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        bool list_types{false};
        bool help{false};
    };

    // =============================================================================
    // command line parsing
    // =============================================================================

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} <devices.csv> [options]

The CSV needs the headers ip, dns, command. Optional columns:
  device_type               per-device platform, overrides --device-type
  credential                profile name, read from NETRUN_<PROFILE>_USERNAME/_PASSWORD/_SECRET

Run:
  --workers <n>             Concurrent sessions, 1-50 (default: 10)
  --batch-size <n>          Devices per batch, 1-100 (default: 5)
  --mode <normal|config>    Send commands one by one, or as one configuration block (default: normal)
  --connect-timeout <s>     Connect and login timeout (default: 30)
  --command-timeout <s>     Per-command timeout (default: 120)
  --retries <n>             Extra attempts after a connect or timeout failure (default: 2)
  --retry-delay <ms>        Pause between attempts (default: 1000)

Devices:
  --device-type <type>      Platform when the CSV has none (default: cisco_ios)
  --user <name>             Login user; password from NETRUN_PASSWORD or prompted
  --enable                  Enter privileged mode; secret from NETRUN_ENABLE_SECRET or prompted
  --port <n>                SSH port (default: 22)
  --key <path>              Private key tried before the password
  --strict-host-key         Refuse hosts missing from known_hosts

Output:
  --output <dir>            Report directory (default: output)
  --format <csv|txt>        Report format (default: csv)
  --log-file <path>         Also write a debug log there
  --verbose                 Debug output on the console
  --list-types              Print the supported device types

Signals:
  SIGINT/SIGTERM cancel the run, SIGUSR1 pauses, SIGUSR2 resumes

Example:
  NETRUN_PASSWORD=secret {} devices.csv --user admin --workers 20 --batch-size 10

)",
                   program_name, program_name);
    }

    template <typename T>
    [[nodiscard]] auto parse_number(std::string_view const flag, std::string_view const value) -> netrun::result<T>
    {
        T number{};
        auto const [end, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
        if (ec != std::errc{} || end != value.data() + value.size())
        {
            return std::unexpected{netrun::make_error(netrun::error_code::invalid_config, "{} expects a number, got '{}'",
                                                      flag, value)};
        }
        return number;
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> netrun::result<cli_options>
    {
        cli_options options;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            auto next = [&]() -> netrun::result<std::string_view>
            {
                if (i + 1 >= argc)
                {
                    return std::unexpected{
                        netrun::make_error(netrun::error_code::invalid_config, "{} needs a value", arg)};
                }
                return std::string_view{argv[++i]};
            };

            auto number = [&]<typename T>(T &target) -> netrun::void_result
            {
                auto value = next();
                if (!value.has_value())
                {
                    return std::unexpected{value.error()};
                }
                auto parsed = parse_number<T>(arg, *value);
                if (!parsed.has_value())
                {
                    return std::unexpected{parsed.error()};
                }
                target = *parsed;
                return {};
            };

            auto seconds = [&](std::chrono::seconds &target) -> netrun::void_result
            {
                long long count = 0;
                auto parsed = number(count);
                target = std::chrono::seconds{count};
                return parsed;
            };

            netrun::void_result status{};

            if (arg == "--workers")
            {
                status = number(options.run.max_workers);
            }
            else if (arg == "--batch-size")
            {
                status = number(options.run.batch_size);
            }
            else if (arg == "--connect-timeout")
            {
                status = seconds(options.run.connect_timeout);
            }
            else if (arg == "--command-timeout")
            {
                status = seconds(options.run.command_timeout);
            }
            else if (arg == "--retries")
            {
                status = number(options.run.retry_count);
            }
            else if (arg == "--retry-delay")
            {
                long long ms = 0;
                status = number(ms);
                options.run.retry_delay = std::chrono::milliseconds{ms};
            }
            else if (arg == "--mode")
            {
                auto value = next();
                auto mode = value.and_then([](std::string_view const v) { return netrun::parse_execution_mode(v); });
                if (mode.has_value())
                {
                    options.run.mode = *mode;
                }
                else
                {
                    status = std::unexpected{mode.error()};
                }
            }
            else if (arg == "--device-type")
            {
                auto value = next();
                if (value.has_value())
                {
                    options.device_type = *value;
                }
                else
                {
                    status = std::unexpected{value.error()};
                }
            }
            else if (arg == "--user")
            {
                auto value = next();
                if (value.has_value())
                {
                    options.username = *value;
                }
                else
                {
                    status = std::unexpected{value.error()};
                }
            }
            else if (arg == "--enable")
            {
                options.escalate = true;
            }
            else if (arg == "--port")
            {
                status = number(options.port);
            }
            else if (arg == "--key")
            {
                auto value = next();
                if (value.has_value())
                {
                    options.key_path = *value;
                }
                else
                {
                    status = std::unexpected{value.error()};
                }
            }
            else if (arg == "--strict-host-key")
            {
                options.strict_host_key = true;
            }
            else if (arg == "--output")
            {
                auto value = next();
                if (value.has_value())
                {
                    options.output_dir = *value;
                }
                else
                {
                    status = std::unexpected{value.error()};
                }
            }
            else if (arg == "--format")
            {
                auto value = next();
                auto format = value.and_then([](std::string_view const v) { return netrun::parse_export_format(v); });
                if (format.has_value())
                {
                    options.format = *format;
                }
                else
                {
                    status = std::unexpected{format.error()};
                }
            }
            else if (arg == "--log-file")
            {
                auto value = next();
                if (value.has_value())
                {
                    options.log_file = std::filesystem::path{*value};
                }
                else
                {
                    status = std::unexpected{value.error()};
                }
            }
            else if (arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "--list-types")
            {
                options.list_types = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                options.help = true;
            }
            else if (!arg.starts_with("-") && options.devices_file.empty())
            {
                options.devices_file = arg;
            }
            else
            {
                status = std::unexpected{netrun::make_error(netrun::error_code::invalid_config, "unknown argument '{}'", arg)};
            }

            if (!status.has_value())
            {
                return std::unexpected{status.error()};
            }
        }

        if (options.help || options.list_types)
        {
            return options;
        }
        if (options.devices_file.empty())
        {
            return std::unexpected{netrun::make_error(netrun::error_code::invalid_config, "no device table given")};
        }
        if (auto valid = options.run.validate(); !valid.has_value())
        {
            return std::unexpected{valid.error()};
        }
        return options;
    }

    // =============================================================================
    // secrets
    // =============================================================================

    [[nodiscard]] auto read_secret(std::string_view const prompt) -> std::string
    {
        fmt::print(stderr, "{}", prompt);
        std::fflush(stderr);

        termios saved{};
        bool tty = ::isatty(STDIN_FILENO) != 0 && ::tcgetattr(STDIN_FILENO, &saved) == 0;
        if (tty)
        {
            auto silent = saved;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            tty = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }

        std::string secret;
        std::getline(std::cin, secret);

        if (tty)
        {
            if (::tcsetattr(STDIN_FILENO, TCSANOW, &saved) != 0)
            {
                spdlog::warn("could not restore terminal echo");
            }
            fmt::print(stderr, "\n");
        }
        return secret;
    }

    [[nodiscard]] auto env_or_prompt(char const *variable, std::string_view const prompt) -> std::string
    {
        if (auto const *value = std::getenv(variable); value != nullptr)
        {
            return value;
        }
        return read_secret(prompt);
    }

    // =============================================================================
    // signals - a watcher thread turns them into run_context calls
    // =============================================================================

    class signal_watcher
    {
    private:
        netrun::run_context &ctx_;
        std::atomic<bool> running_{true};
        std::thread thread_;

    public:
        // the signal mask must already be blocked in every thread
        explicit signal_watcher(netrun::run_context &ctx) : ctx_{ctx}, thread_{[this] { watch(); }} {}

        ~signal_watcher()
        {
            running_.store(false);
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        signal_watcher(signal_watcher const &) = delete;
        auto operator=(signal_watcher const &) -> signal_watcher & = delete;
        signal_watcher(signal_watcher &&) = delete;
        auto operator=(signal_watcher &&) -> signal_watcher & = delete;

        [[nodiscard]] static auto watched() -> sigset_t
        {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            sigaddset(&set, SIGUSR1);
            sigaddset(&set, SIGUSR2);
            return set;
        }

    private:
        auto watch() -> void
        {
            auto const set = watched();
            timespec const tick{.tv_sec = 0, .tv_nsec = 200'000'000};

            while (running_.load())
            {
                auto const sig = ::sigtimedwait(&set, nullptr, &tick);
                switch (sig)
                {
                case SIGINT:
                case SIGTERM:
                    if (ctx_.is_cancelled())
                    {
                        // second interrupt: give up on a clean shutdown
                        std::_Exit(exit_status::fatal);
                    }
                    ctx_.cancel();
                    break;
                case SIGUSR1:
                    ctx_.pause();
                    break;
                case SIGUSR2:
                    ctx_.resume();
                    break;
                default:
                    break;
                }
            }
        }
    };

    // =============================================================================
    // progress rendering
    // =============================================================================

    auto render_progress(netrun::progress_queue &queue) -> void
    {
        while (auto event = queue.pop())
        {
            switch (event->kind)
            {
            case netrun::progress_kind::run_started:
                fmt::print(fmt::fg(fmt::color::cyan), "[*] {} device(s) in {} batch(es)\n", event->devices_total,
                           event->batch_count);
                break;
            case netrun::progress_kind::device_completed:
            {
                auto const style = event->terminal == netrun::session_state::terminal_success ? fmt::fg(fmt::color::green)
                                   : event->terminal == netrun::session_state::terminal_cancelled
                                       ? fmt::fg(fmt::color::yellow)
                                       : fmt::fg(fmt::color::red);
                fmt::print(style, "[{:>5.1f}%] {} {} ({:.1f}s)\n", event->percent(),
                           event->target ? event->target->label() : std::string{"?"},
                           netrun::to_string(event->terminal),
                           static_cast<double>(event->elapsed.count()) / 1000.0);
                break;
            }
            case netrun::progress_kind::batch_completed:
                fmt::print(fmt::fg(fmt::color::cyan), "[*] batch {}/{} done: {}/{} device(s), {} ok / {} failed\n",
                           event->batch, event->batch_count, event->devices_completed, event->devices_total,
                           event->counters.succeeded, event->counters.failed);
                break;
            case netrun::progress_kind::run_finished:
                break;
            }
            std::fflush(stdout);
        }
    }

    auto print_summary(netrun::execution_report const &report) -> void
    {
        auto const &c = report.counters;
        fmt::print(fmt::fg(fmt::color::yellow), "\n=== Summary ===\n\n");
        fmt::print("  devices    {}\n", report.devices_total);
        fmt::print("  succeeded  {}\n", c.succeeded);
        fmt::print("  failed     {}\n", c.failed);
        fmt::print("  skipped    {}\n", c.skipped);
        fmt::print("  cancelled  {}\n", c.cancelled);

        if (c.failed > 0)
        {
            fmt::print("\n  failures by kind:\n");
            for (auto const kind : {netrun::failure_kind::connect, netrun::failure_kind::auth,
                                    netrun::failure_kind::timeout, netrun::failure_kind::command})
            {
                if (auto const n = report.failures_of(kind); n > 0)
                {
                    fmt::print(fmt::fg(fmt::color::red), "    {:<10} {}\n", kind, n);
                }
            }
        }
        if (report.cancelled)
        {
            fmt::print(fmt::fg(fmt::color::yellow), "\n  run was cancelled\n");
        }
        fmt::print("\n");
    }

    auto print_error(netrun::error const &err) -> void
    {
        fmt::print(stderr, fmt::fg(fmt::color::red), "[!] {}\n", err);
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto options = parse_args(argc, argv);
    if (!options.has_value())
    {
        print_error(options.error());
        print_usage(argv[0]);
        return exit_status::fatal;
    }
    if (options->help)
    {
        print_usage(argv[0]);
        return exit_status::ok;
    }
    if (options->list_types)
    {
        fmt::print("{}\n", fmt::join(netrun::supported_device_types(), "\n"));
        return exit_status::ok;
    }

    if (auto logging = netrun::init_logging({.level = options->verbose ? spdlog::level::debug : spdlog::level::info,
                                             .file = options->log_file});
        !logging.has_value())
    {
        print_error(logging.error());
        return exit_status::fatal;
    }

    // validation happens before anything connects
    auto table = netrun::load_device_table(options->devices_file);
    if (!table.has_value())
    {
        print_error(table.error());
        return exit_status::fatal;
    }

    netrun::unit_defaults defaults{
        .device_type = options->device_type,
        .creds = {},
        .port = options->port,
        .mode = options->run.mode,
    };
    defaults.creds.username = options->username;
    if (!options->username.empty())
    {
        defaults.creds.password = env_or_prompt("NETRUN_PASSWORD", fmt::format("password for {}: ", options->username));
        if (options->escalate)
        {
            auto secret = env_or_prompt("NETRUN_ENABLE_SECRET", "enable secret (empty reuses the password): ");
            defaults.creds.elevation_secret = secret.empty() ? defaults.creds.password : secret;
        }
    }

    netrun::env_credential_store const profiles;
    auto units = netrun::build_execution_units(*table, defaults, profiles);
    if (!units.has_value())
    {
        print_error(units.error());
        return exit_status::fatal;
    }

    // block the control signals before any thread exists so only the watcher sees them
    auto const mask = signal_watcher::watched();
    if (auto const rc = ::pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0)
    {
        print_error(netrun::make_error(netrun::error_code::internal_fault, "blocking signals failed: {}",
                                       std::strerror(rc)));
        return exit_status::fatal;
    }

    netrun::run_context ctx{options->run};
    netrun::ssh::transport link{netrun::ssh::transport_config{
        .private_key_path = options->key_path,
        .private_key_passphrase = {},
        .strict_host_key_checking = options->strict_host_key,
        .try_agent_keys = false,
        .verbosity = 0,
        .terminal_width = 511,
        .terminal_height = 0,
    }};

    netrun::progress_queue progress;
    std::thread renderer{[&progress] { render_progress(progress); }};

    auto report = [&]
    {
        signal_watcher const watcher{ctx};
        netrun::batch_scheduler scheduler{link, ctx, netrun::scheduler_options{.progress = &progress}};
        return scheduler.run(*units);
    }();

    progress.close();
    renderer.join();

    if (!report.has_value())
    {
        print_error(report.error());
        return exit_status::fatal;
    }

    print_summary(*report);

    auto const path =
        options->output_dir / netrun::output_filename(*report, options->format, std::chrono::system_clock::now());
    if (auto written = netrun::write_report(*report, path, options->format); !written.has_value())
    {
        print_error(written.error());
        return exit_status::fatal;
    }
    fmt::print(fmt::fg(fmt::color::green), "[*] report: {}\n", path.string());

    return report->all_succeeded() ? exit_status::ok : exit_status::device_failures;
}
