#pragma once

#include "Observation.hpp"
#include "SimulationConfig.hpp"
#include "SimulatorEngine.hpp"

#include <string>
#include <vector>

namespace queuesim
{
    struct ConfigParseResult
    {
        bool ok = false;
        SimulationConfig config{};
        bool used_default_lanes = false;
        std::vector<std::string> errors;
    };

    std::string laneClassToString(LaneClass lane_class);
    bool laneClassFromString(const std::string &value, LaneClass &lane_class);

    std::string simulationConfigToJson(const SimulationConfig &config);

    // Missing keys keep their defaults; shape errors leave ok == false.
    // Value ranges are not checked here, see SafetyChecker::validateConfig.
    ConfigParseResult simulationConfigFromJson(const std::string &json_text);

    std::string observationsToJson(const std::vector<ObservationRow> &rows, const SimulatorMetrics &metrics);
} // namespace queuesim
