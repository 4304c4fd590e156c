#pragma once

// device_table.hpp - device list input: a CSV table with ip, dns and command columns
// a command cell may hold several lines, repeated ip|dns rows add commands to the same device

#include "common.hpp"
#include "device.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace netrun
{

    namespace columns
    {
        inline constexpr std::string_view ip = "ip";
        inline constexpr std::string_view dns = "dns";
        inline constexpr std::string_view command = "command";
        inline constexpr std::string_view device_type = "device_type"; // optional
        inline constexpr std::string_view credential = "credential";   // optional, profile name
    } // namespace columns

    struct device_entry
    {
        device target{};
        std::vector<std::string> commands{};
    };

    struct device_table
    {
        std::vector<device_entry> entries{};

        [[nodiscard]] auto size() const noexcept -> std::size_t { return entries.size(); }
        [[nodiscard]] auto empty() const noexcept -> bool { return entries.empty(); }
    };

    // RFC 4180 records; quoted fields may contain separators, quotes ("") and newlines
    [[nodiscard]] auto parse_csv_records(std::string_view content) -> result<std::vector<std::vector<std::string>>>;

    // errors: missing_column, validation_failed
    [[nodiscard]] auto parse_device_table(std::string_view content) -> result<device_table>;

    // errors: file_open_failed plus everything parse_device_table reports
    [[nodiscard]] auto load_device_table(std::filesystem::path const &path) -> result<device_table>;

} // namespace netrun
