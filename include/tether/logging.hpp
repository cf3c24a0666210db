#pragma once

#include "types.hpp"
#include <string>

namespace tether
{
    /**
     * Route operator logging to stderr at the given level (trace, debug, info,
     * warn, error, critical, off). stdout stays free for command output.
     */
    Result<void> configure_logging(const std::string &level);

} // namespace tether
