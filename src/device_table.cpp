// device_table.cpp - CSV device list reader
// every spreadsheet export is RFC 4180 until a cell holds a newline

#include "netrun/device_table.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace netrun
{

    namespace
    {

        struct column_layout
        {
            std::size_t ip{0};
            std::size_t dns{0};
            std::size_t command{0};
            std::optional<std::size_t> device_type{};
            std::optional<std::size_t> credential{};
        };

        [[nodiscard]] auto locate_columns(std::vector<std::string> const &header) -> result<column_layout>
        {
            std::unordered_map<std::string, std::size_t> index;
            for (std::size_t i = 0; i < header.size(); ++i)
            {
                auto name = text::to_lower(text::trim(header[i]));
                // a UTF-8 BOM sticks to the first header cell when the file came out of Excel
                if (i == 0 && name.starts_with("\xEF\xBB\xBF"))
                {
                    name.erase(0, 3);
                }
                index.emplace(std::move(name), i);
            }

            auto required = [&](std::string_view const name) -> result<std::size_t>
            {
                auto const it = index.find(std::string{name});
                if (it == index.end())
                {
                    return std::unexpected{make_error(error_code::missing_column,
                                                      "'{}' (required headers: ip, dns, command)", name)};
                }
                return it->second;
            };
            auto optional = [&](std::string_view const name) -> std::optional<std::size_t>
            {
                auto const it = index.find(std::string{name});
                return it == index.end() ? std::nullopt : std::optional<std::size_t>{it->second};
            };

            auto ip = required(columns::ip);
            if (!ip.has_value())
            {
                return std::unexpected{ip.error()};
            }
            auto dns = required(columns::dns);
            if (!dns.has_value())
            {
                return std::unexpected{dns.error()};
            }
            auto command = required(columns::command);
            if (!command.has_value())
            {
                return std::unexpected{command.error()};
            }

            return column_layout{
                .ip = *ip,
                .dns = *dns,
                .command = *command,
                .device_type = optional(columns::device_type),
                .credential = optional(columns::credential),
            };
        }

        [[nodiscard]] auto cell(std::vector<std::string> const &row, std::size_t const column) -> std::string_view
        {
            return column < row.size() ? text::trim(row[column]) : std::string_view{};
        }

        [[nodiscard]] auto is_blank(std::vector<std::string> const &row) -> bool
        {
            for (auto const &value : row)
            {
                if (!text::trim(value).empty())
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    auto parse_csv_records(std::string_view const content) -> result<std::vector<std::vector<std::string>>>
    {
        std::vector<std::vector<std::string>> records;
        std::vector<std::string> record;
        std::string field;
        bool in_quotes = false;
        bool field_started = false;
        std::size_t line = 1;

        auto end_field = [&]
        {
            record.push_back(std::move(field));
            field.clear();
            field_started = false;
        };
        auto end_record = [&]
        {
            end_field();
            records.push_back(std::move(record));
            record.clear();
        };

        for (std::size_t i = 0; i < content.size(); ++i)
        {
            auto const c = content[i];

            if (in_quotes)
            {
                if (c == '"')
                {
                    if (i + 1 < content.size() && content[i + 1] == '"')
                    {
                        field.push_back('"');
                        ++i;
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    if (c == '\n')
                    {
                        ++line;
                    }
                    field.push_back(c);
                }
                continue;
            }

            switch (c)
            {
            case '"':
                if (field_started && !text::trim(field).empty())
                {
                    return std::unexpected{
                        make_error(error_code::validation_failed, "line {}: quote inside an unquoted field", line)};
                }
                field.clear();
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                ++line;
                break;
            default:
                field.push_back(c);
                field_started = true;
                break;
            }
        }

        if (in_quotes)
        {
            return std::unexpected{make_error(error_code::validation_failed, "line {}: unterminated quoted field", line)};
        }
        if (field_started || !field.empty() || !record.empty())
        {
            end_record();
        }
        return records;
    }

    auto parse_device_table(std::string_view const content) -> result<device_table>
    {
        auto records = parse_csv_records(content);
        if (!records.has_value())
        {
            return std::unexpected{records.error()};
        }
        if (records->empty())
        {
            return std::unexpected{make_error(error_code::missing_column, "empty device table, no header row")};
        }

        auto layout = locate_columns(records->front());
        if (!layout.has_value())
        {
            return std::unexpected{layout.error()};
        }

        device_table table;
        std::unordered_map<std::string, std::size_t> by_key;

        for (std::size_t r = 1; r < records->size(); ++r)
        {
            auto const &row = (*records)[r];
            if (is_blank(row))
            {
                continue;
            }

            device target{
                .address = std::string{cell(row, layout->ip)},
                .dns = std::string{cell(row, layout->dns)},
                .device_type = layout->device_type ? std::string{cell(row, *layout->device_type)} : std::string{},
                .credential_profile = {},
                .port = 22,
            };
            if (layout->credential)
            {
                if (auto const profile = cell(row, *layout->credential); !profile.empty())
                {
                    target.credential_profile = std::string{profile};
                }
            }

            if (target.address.empty())
            {
                return std::unexpected{make_error(error_code::validation_failed, "record {}: empty ip", r + 1)};
            }

            auto [it, inserted] = by_key.try_emplace(target.key(), table.entries.size());
            if (inserted)
            {
                table.entries.push_back(device_entry{.target = target, .commands = {}});
            }

            auto &entry = table.entries[it->second];
            if (!inserted)
            {
                if (!target.device_type.empty() && target.device_type != entry.target.device_type)
                {
                    if (!entry.target.device_type.empty())
                    {
                        return std::unexpected{make_error(error_code::validation_failed,
                                                          "record {}: {} listed as both '{}' and '{}'", r + 1,
                                                          target.label(), entry.target.device_type, target.device_type)};
                    }
                    entry.target.device_type = target.device_type;
                }
                if (target.credential_profile && !entry.target.credential_profile)
                {
                    entry.target.credential_profile = target.credential_profile;
                }
            }

            for (auto const line : text::split_lines(cell(row, layout->command)))
            {
                if (auto const command = text::trim(line); !command.empty())
                {
                    entry.commands.emplace_back(command);
                }
            }
        }

        for (auto const &entry : table.entries)
        {
            if (entry.commands.empty())
            {
                return std::unexpected{
                    make_error(error_code::validation_failed, "{} has no commands", entry.target.label())};
            }
        }
        if (table.empty())
        {
            return std::unexpected{make_error(error_code::validation_failed, "device table lists no devices")};
        }

        return table;
    }

    auto load_device_table(std::filesystem::path const &path) -> result<device_table>
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return std::unexpected{make_error(error_code::file_open_failed, "{}", path.string())};
        }

        std::ostringstream content;
        content << file.rdbuf();
        return parse_device_table(content.str());
    }

} // namespace netrun
