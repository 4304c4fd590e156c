// logging.cpp - spdlog sinks for the run log

#include "netrun/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace netrun
{

    auto init_logging(log_options const &options) -> void_result
    {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(options.level);
        sinks.push_back(console);

        if (options.file.has_value())
        {
            try
            {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), true);
                file->set_level(spdlog::level::debug);
                sinks.push_back(std::move(file));
            }
            catch (spdlog::spdlog_ex const &e)
            {
                return std::unexpected{make_error(error_code::file_open_failed, "{}: {}", options.file->string(), e.what())};
            }
        }

        auto logger = std::make_shared<spdlog::logger>("netrun", sinks.begin(), sinks.end());
        logger->set_pattern(log_pattern);
        logger->set_level(options.file.has_value() ? std::min(options.level, spdlog::level::debug) : options.level);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(std::move(logger));
        return {};
    }

} // namespace netrun
