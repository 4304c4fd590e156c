// common.cpp - error category and string helpers

#include "netrun/common.hpp"

#include <algorithm>
#include <cctype>

namespace netrun
{

    namespace
    {

        class netrun_error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "netrun"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error_code>(ev))
                {
                case error_code::success:
                    return "success";
                case error_code::validation_failed:
                    return "input validation failed";
                case error_code::unsupported_device_type:
                    return "unsupported device type";
                case error_code::missing_column:
                    return "required column missing from device table";
                case error_code::invalid_config:
                    return "run configuration out of range";
                case error_code::credential_unavailable:
                    return "credential profile could not be resolved";
                case error_code::connect_failed:
                    return "connection to device failed";
                case error_code::auth_failed:
                    return "authentication failed";
                case error_code::timeout:
                    return "operation timed out";
                case error_code::command_failed:
                    return "command rejected by device";
                case error_code::cancelled:
                    return "cancelled by user";
                case error_code::internal_fault:
                    return "internal fault";
                case error_code::file_open_failed:
                    return "failed to open file";
                case error_code::file_write_failed:
                    return "failed to write file";
                default:
                    return fmt::format("unknown netrun error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto netrun_error_category() noexcept -> std::error_category const &
        {
            static netrun_error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto make_error_code(error_code e) noexcept -> std::error_code
    {
        return {static_cast<int>(e), netrun_error_category()};
    }

    auto error::message() const -> std::string
    {
        auto const base = netrun_error_category().message(static_cast<int>(code));
        if (detail.empty())
        {
            return base;
        }
        return fmt::format("{}: {}", base, detail);
    }

    namespace text
    {

        auto trim(std::string_view str) noexcept -> std::string_view
        {
            auto const is_space = [](char const c)
            { return std::isspace(static_cast<unsigned char>(c)) != 0; };

            while (!str.empty() && is_space(str.front()))
            {
                str.remove_prefix(1);
            }
            while (!str.empty() && is_space(str.back()))
            {
                str.remove_suffix(1);
            }
            return str;
        }

        auto to_lower(std::string_view str) -> std::string
        {
            std::string out{str};
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char const c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        auto split_lines(std::string_view str) -> std::vector<std::string_view>
        {
            std::vector<std::string_view> lines;
            while (!str.empty())
            {
                auto const pos = str.find('\n');
                auto line = str.substr(0, pos);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                if (pos == std::string_view::npos)
                {
                    break;
                }
                str.remove_prefix(pos + 1);
            }
            return lines;
        }

    } // namespace text

} // namespace netrun
