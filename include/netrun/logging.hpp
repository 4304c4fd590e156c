#pragma once

// logging.hpp - run log setup: coloured stderr plus an optional file

#include "common.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>

namespace netrun
{

    inline constexpr auto log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    struct log_options
    {
        spdlog::level::level_enum level{spdlog::level::info};
        std::optional<std::filesystem::path> file{}; // always written at debug level
    };

    // replaces the default logger; call once before any worker starts
    // errors: file_open_failed
    [[nodiscard]] auto init_logging(log_options const &options) -> void_result;

} // namespace netrun
