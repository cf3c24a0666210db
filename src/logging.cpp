#include "tether/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tether
{

    Result<void> configure_logging(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps anything unknown to off
        if (parsed == spdlog::level::off && level != "off")
            return std::unexpected(TetherError::config("Unknown log level: " + level));

        auto logger = spdlog::get("tether");
        if (!logger)
        {
            logger = spdlog::stderr_color_mt("tether");
            spdlog::set_default_logger(logger);
        }
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ %v");
        spdlog::set_level(parsed);
        return {};
    }

} // namespace tether
