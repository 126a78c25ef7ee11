#include "SafetyChecker.hpp"

#include <cmath>

namespace queuesim
{

    SignalState observedSignalState(const std::vector<Lane> &lanes)
    {
        SignalState state;
        for (const Lane &lane : lanes)
        {
            if (!lane.isGreen())
            {
                continue;
            }
            if (lane.laneClass() == LaneClass::Car)
            {
                state.car_green = true;
            }
            else
            {
                state.bike_green = true;
            }
        }
        return state;
    }

    bool SafetyChecker::isSafe(const SignalState &state) const
    {
        return !(state.car_green && state.bike_green);
    }

    bool SafetyChecker::isSafe(const std::vector<Lane> &lanes) const
    {
        return isSafe(observedSignalState(lanes));
    }

    void SafetyChecker::checkCycle(const CycleConfig &cycle, std::vector<std::string> &errors) const
    {
        if (cycle.bike_green_duration < 0)
        {
            errors.push_back("GREEN_BIKES must not be negative");
        }
        if (cycle.car_green_duration < 0)
        {
            errors.push_back("GREEN_CARS must not be negative");
        }
        if (cycle.all_red_duration < 0)
        {
            errors.push_back("RED_TIME_ALL must not be negative");
        }
        const bool any_negative = cycle.bike_green_duration < 0 || cycle.car_green_duration < 0 || cycle.all_red_duration < 0;
        if (any_negative)
        {
            return;
        }
        if (cycle.cycleLength() <= 0)
        {
            errors.push_back("cycle length must be positive");
        }
        else if (cycle.cycleLength() > kMaxCycleLength)
        {
            errors.push_back("cycle length exceeds " + std::to_string(kMaxCycleLength) + " ticks");
        }
    }

    void SafetyChecker::checkLanes(const std::vector<LaneDescriptor> &lanes, std::vector<std::string> &errors) const
    {
        for (std::size_t i = 0; i < lanes.size(); ++i)
        {
            const double rate = lanes[i].arrival_rate;
            if (!std::isfinite(rate) || rate <= 0.0)
            {
                errors.push_back("lanes[" + std::to_string(i) + "].business must be positive");
            }
            else if (rate > kMaxArrivalRate)
            {
                errors.push_back("lanes[" + std::to_string(i) + "].business must not exceed " + std::to_string(kMaxArrivalRate));
            }
        }
    }

    std::vector<std::string> SafetyChecker::validateConfig(const SimulationConfig &config) const
    {
        std::vector<std::string> errors;
        checkCycle(config.cycle, errors);
        if (!std::isfinite(config.sim_length_hours) || config.sim_length_hours < 0.0)
        {
            errors.push_back("SIM_LENGTH must not be negative");
        }
        else if (config.sim_length_hours > kMaxSimLengthHours)
        {
            errors.push_back("SIM_LENGTH must not exceed " + std::to_string(kMaxSimLengthHours) + " hours");
        }
        checkLanes(config.lanes, errors);
        return errors;
    }

    bool SafetyChecker::isConfigValid(const SimulationConfig &config) const
    {
        return validateConfig(config).empty();
    }

} // namespace queuesim
