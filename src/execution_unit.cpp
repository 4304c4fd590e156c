// execution_unit.cpp - device table to execution units

#include "netrun/execution_unit.hpp"

#include "netrun/credentials.hpp"
#include "netrun/device_table.hpp"

#include <spdlog/spdlog.h>

namespace netrun
{

    auto build_execution_units(device_table const &table, unit_defaults const &defaults,
                               credential_store const &store) -> result<std::vector<execution_unit>>
    {
        if (table.empty())
        {
            return std::unexpected{make_error(error_code::validation_failed, "no devices to run against")};
        }

        std::vector<execution_unit> units;
        units.reserve(table.size());

        for (std::size_t i = 0; i < table.entries.size(); ++i)
        {
            auto const &entry = table.entries[i];

            device target = entry.target;
            if (target.device_type.empty())
            {
                target.device_type = defaults.device_type;
            }
            target.port = defaults.port;

            auto driver = resolve_driver(target.device_type);
            if (!driver.has_value())
            {
                return std::unexpected{make_error(driver.error().code, "{}: {}", target.label(), driver.error().detail)};
            }

            credentials creds = defaults.creds;
            if (target.credential_profile.has_value())
            {
                auto resolved = store.resolve(*target.credential_profile);
                if (!resolved.has_value())
                {
                    return std::unexpected{
                        make_error(resolved.error().code, "{}: {}", target.label(), resolved.error().detail)};
                }
                creds = std::move(*resolved);
            }
            if (creds.username.empty())
            {
                return std::unexpected{make_error(error_code::credential_unavailable, "{}: no username", target.label())};
            }

            spdlog::debug("{}: {} as {}, {} command(s)", target.label(), traits_of(*driver).name, creds,
                          entry.commands.size());

            units.push_back(execution_unit{
                .index = i,
                .target = std::move(target),
                .commands = command_set{.commands = entry.commands, .mode = defaults.mode},
                .creds = std::move(creds),
                .driver = *driver,
            });
        }

        return units;
    }

} // namespace netrun
