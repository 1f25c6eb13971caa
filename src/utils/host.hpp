#pragma once
#include <cstdlib>
#include <string>
#include "logging.hpp"

namespace host
{

    // Runs the configured power-off command; false when it is empty or exits non-zero
    inline bool powerOff(const std::string &command)
    {
        if (command.empty())
        {
            log_error("No power-off command configured");
            return false;
        }

        log_warning("Powering down: " + command);
        int status = std::system(command.c_str());
        if (status != 0)
        {
            log_error("Power-off command failed with status " + std::to_string(status));
            return false;
        }
        return true;
    }

}
