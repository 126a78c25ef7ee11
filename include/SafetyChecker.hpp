#pragma once

#include "Lane.hpp"
#include "PhaseScheduler.hpp"
#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace queuesim
{

    class SafetyChecker
    {
    public:
        SafetyChecker() = default;

        // Car and bike signals must never be green together
        bool isSafe(const SignalState &state) const;
        bool isSafe(const std::vector<Lane> &lanes) const;

        // Collects every out-of-range value; empty result means valid
        std::vector<std::string> validateConfig(const SimulationConfig &config) const;
        bool isConfigValid(const SimulationConfig &config) const;

    private:
        void checkCycle(const CycleConfig &cycle, std::vector<std::string> &errors) const;
        void checkLanes(const std::vector<LaneDescriptor> &lanes, std::vector<std::string> &errors) const;
    };

    // Signal pair as seen through the lanes themselves
    SignalState observedSignalState(const std::vector<Lane> &lanes);

} // namespace queuesim
