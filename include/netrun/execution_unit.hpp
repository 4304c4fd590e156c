#pragma once

// execution_unit.hpp - one device, its commands and everything resolved before the run starts

#include "common.hpp"
#include "device.hpp"
#include "device_driver.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace netrun
{

    class credential_store;
    struct device_table;

    struct execution_unit
    {
        std::size_t index{0}; // position in the device list, fixes the report slot
        device target{};
        command_set commands{};
        credentials creds{};
        device_driver driver{};
    };

    struct unit_defaults
    {
        std::string device_type{"cisco_ios"};
        credentials creds{};
        std::uint16_t port{22};
        execution_mode mode{execution_mode::normal};
    };

    // resolves drivers and credential profiles for every device, in table order
    // any failure is a validation error and nothing is returned
    [[nodiscard]] auto build_execution_units(device_table const &table, unit_defaults const &defaults,
                                             credential_store const &store) -> result<std::vector<execution_unit>>;

} // namespace netrun
