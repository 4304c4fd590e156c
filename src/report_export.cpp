// report_export.cpp - CSV and text rendering of execution reports

#include "netrun/report_export.hpp"

#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>

namespace netrun
{

    namespace
    {

        [[nodiscard]] auto needs_quoting(std::string_view const field) noexcept -> bool
        {
            return field.find_first_of(",\"\r\n") != std::string_view::npos ||
                   (!field.empty() && (field.front() == ' ' || field.back() == ' '));
        }

        auto append_field(std::string &out, std::string_view const field) -> void
        {
            if (!needs_quoting(field))
            {
                out.append(field);
                return;
            }
            out.push_back('"');
            for (auto const c : field)
            {
                if (c == '"')
                {
                    out.push_back('"');
                }
                out.push_back(c);
            }
            out.push_back('"');
        }

        auto append_record(std::string &out, export_row const &row) -> void
        {
            append_field(out, row.ip);
            out.push_back(',');
            append_field(out, row.dns);
            out.push_back(',');
            append_field(out, row.command);
            out.push_back(',');
            append_field(out, row.result);
            out.append("\r\n");
        }

    } // namespace

    auto parse_export_format(std::string_view const str) -> result<export_format>
    {
        auto const lowered = text::to_lower(text::trim(str));
        if (lowered == "csv")
        {
            return export_format::csv;
        }
        if (lowered == "txt" || lowered == "text")
        {
            return export_format::txt;
        }
        return std::unexpected{make_error(error_code::invalid_config, "output format '{}' (expected csv or txt)", str)};
    }

    auto extension_of(export_format const format) noexcept -> std::string_view
    {
        switch (format)
        {
        case export_format::csv:
            return "csv";
        case export_format::txt:
            return "txt";
        }
        return "out";
    }

    auto result_text(session_result const &row) -> std::string
    {
        if (row.status == command_status::success)
        {
            return row.output;
        }
        if (row.failure.has_value())
        {
            return fmt::format("{} ({}): {}", row.status, *row.failure, row.output);
        }
        return fmt::format("{}: {}", row.status, row.output);
    }

    auto export_rows(execution_report const &report) -> std::vector<export_row>
    {
        std::vector<export_row> rows;
        rows.reserve(report.counters.total());

        for (auto const &entry : report.entries)
        {
            bool first = true;
            for (auto const &result : entry.results)
            {
                rows.push_back(export_row{
                    .ip = first ? entry.target.address : std::string{},
                    .dns = first ? entry.target.dns : std::string{},
                    .command = result.command,
                    .result = result_text(result),
                });
                first = false;
            }
        }
        return rows;
    }

    auto render_csv(execution_report const &report) -> std::string
    {
        std::string out;
        append_record(out, export_row{.ip = "ip", .dns = "dns", .command = "command", .result = "result"});
        for (auto const &row : export_rows(report))
        {
            append_record(out, row);
        }
        return out;
    }

    auto render_txt(execution_report const &report) -> std::string
    {
        std::string out;
        auto it = std::back_inserter(out);

        for (auto const &entry : report.entries)
        {
            fmt::format_to(it, "==== {} [{}] ====\n", entry.target.label(), to_string(entry.terminal));
            for (auto const &result : entry.results)
            {
                fmt::format_to(it, "---- {} ({})\n", result.command, result.status);
                auto const body = result_text(result);
                out.append(body);
                if (!body.empty() && body.back() != '\n')
                {
                    out.push_back('\n');
                }
            }
            out.push_back('\n');
        }

        fmt::format_to(it, "succeeded={} failed={} skipped={} cancelled={}{}\n", report.counters.succeeded,
                       report.counters.failed, report.counters.skipped, report.counters.cancelled,
                       report.cancelled ? " (run cancelled)" : "");
        return out;
    }

    auto render(execution_report const &report, export_format const format) -> std::string
    {
        return format == export_format::csv ? render_csv(report) : render_txt(report);
    }

    auto sanitize_filename(std::string_view const name, std::size_t const max_length) -> std::string
    {
        constexpr std::string_view reserved = "/\\:*?\"<>|";

        std::string out{name.substr(0, std::min(name.size(), max_length))};
        std::replace_if(
            out.begin(), out.end(), [&](char const c) { return reserved.find(c) != std::string_view::npos; }, '_');
        return out;
    }

    auto output_filename(execution_report const &report, export_format const format,
                         std::chrono::system_clock::time_point const when) -> std::string
    {
        std::string stem = "netrun";
        if (!report.entries.empty())
        {
            auto const &first = report.entries.front().target;
            stem = first.dns.empty() ? first.address : fmt::format("{}_{}", first.address, first.dns);
        }

        auto const stamp = fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(std::chrono::system_clock::to_time_t(when)));
        auto const suffix = fmt::format("_output_{}.{}", stamp, extension_of(format));

        // the suffix survives truncation, only the device part is shortened
        auto const budget = suffix.size() < 255 ? 255 - suffix.size() : 0;
        return sanitize_filename(stem, budget) + suffix;
    }

    auto write_report(execution_report const &report, std::filesystem::path const &path, export_format const format)
        -> void_result
    {
        if (path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
            {
                return std::unexpected{
                    make_error(error_code::file_open_failed, "{}: {}", path.parent_path().string(), ec.message())};
            }
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            return std::unexpected{make_error(error_code::file_open_failed, "{}", path.string())};
        }

        auto const content = render(report, format);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file)
        {
            return std::unexpected{make_error(error_code::file_write_failed, "{}", path.string())};
        }

        spdlog::info("report written to {} ({} bytes)", path.string(), content.size());
        return {};
    }

} // namespace netrun
