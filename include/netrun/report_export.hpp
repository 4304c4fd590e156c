#pragma once

// report_export.hpp - renders an execution report as CSV or plain text
// identity columns are written on the first row of a device and left blank on the rows after it

#include "aggregator.hpp"
#include "common.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace netrun
{

    enum class export_format : std::uint8_t
    {
        csv,
        txt,
    };

    [[nodiscard]] auto parse_export_format(std::string_view str) -> result<export_format>;

    [[nodiscard]] auto extension_of(export_format format) noexcept -> std::string_view;

    struct export_row
    {
        std::string ip{};
        std::string dns{};
        std::string command{};
        std::string result{};
    };

    // one row per session_result in report order, blank-repeat applied
    [[nodiscard]] auto export_rows(execution_report const &report) -> std::vector<export_row>;

    // output for a success, "<status>[ (<kind>)]: <detail>" otherwise
    [[nodiscard]] auto result_text(session_result const &row) -> std::string;

    // header ip,dns,command,result; RFC 4180 quoting
    [[nodiscard]] auto render_csv(execution_report const &report) -> std::string;

    [[nodiscard]] auto render_txt(execution_report const &report) -> std::string;

    [[nodiscard]] auto render(execution_report const &report, export_format format) -> std::string;

    // / \ : * ? " < > | become '_', then truncated
    [[nodiscard]] auto sanitize_filename(std::string_view name, std::size_t max_length = 255) -> std::string;

    // <first-ip>_<first-dns>_output_<YYYYmmdd_HHMMSS>.<ext>, local time
    [[nodiscard]] auto output_filename(execution_report const &report, export_format format,
                                       std::chrono::system_clock::time_point when) -> std::string;

    // creates missing parent directories
    // errors: file_open_failed, file_write_failed
    [[nodiscard]] auto write_report(execution_report const &report, std::filesystem::path const &path,
                                    export_format format) -> void_result;

} // namespace netrun
