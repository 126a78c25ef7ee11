#pragma once

#include "Lane.hpp"
#include "SimulationConfig.hpp"

#include <cstddef>
#include <vector>

namespace queuesim
{
    struct SignalState
    {
        bool car_green{false};
        bool bike_green{false};
    };

    struct SignalTransition
    {
        LaneClass lane_class;
        bool green;
    };

    class PhaseScheduler
    {
    public:
        enum Phase
        {
            BIKE_GREEN,
            ALL_RED_AFTER_BIKE,
            CAR_GREEN,
            ALL_RED_AFTER_CAR
        };

        // Throws InvalidConfiguration on negative durations or an empty cycle
        explicit PhaseScheduler(const CycleConfig &cycle);

        // Flip signals of matching lanes if tick lands on a phase boundary
        void apply(std::size_t tick, std::vector<Lane> &lanes) const;

        // Transitions for this tick in boundary order, empty off-boundary
        std::vector<SignalTransition> transitionsAt(std::size_t tick) const;

        int phaseTick(std::size_t tick) const;
        Phase phaseAt(std::size_t tick) const;
        SignalState signalStateAt(std::size_t tick) const;

        int cycleLength() const { return cycle_length; }
        const CycleConfig &cycle() const { return config; }

    private:
        CycleConfig config;
        int cycle_length;

        // Boundary offsets within one cycle
        int bike_red_at;
        int car_green_at;
        int car_red_at;
    };

    const char *toString(PhaseScheduler::Phase phase);

} // namespace queuesim
