#pragma once

#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace queuesim
{
    enum class ConfigStatus
    {
        Loaded,     // file read and valid
        Unreadable, // missing, not JSON or wrong shape; defaults in use
        Invalid     // well formed but out of range; run must be rejected
    };

    struct ConfigLoadResult
    {
        ConfigStatus status = ConfigStatus::Unreadable;
        SimulationConfig config = makeDefaultSimulationConfig();
        bool used_default_lanes = false;
        std::vector<std::string> errors;
    };

    ConfigLoadResult loadSimulationConfig(const std::string &file_path);
    ConfigLoadResult loadSimulationConfigFromText(const std::string &json_text);

    const char *toString(ConfigStatus status);

} // namespace queuesim
