#include "PhaseScheduler.hpp"

#include <string>

namespace queuesim
{
    namespace
    {
        const CycleConfig &checkedCycle(const CycleConfig &cycle)
        {
            if (cycle.bike_green_duration < 0 || cycle.car_green_duration < 0 || cycle.all_red_duration < 0)
            {
                throw InvalidConfiguration("signal durations must not be negative");
            }
            if (cycle.cycleLength() <= 0)
            {
                throw InvalidConfiguration("cycle length must be positive");
            }
            if (cycle.cycleLength() > kMaxCycleLength)
            {
                throw InvalidConfiguration("cycle length exceeds " + std::to_string(kMaxCycleLength) + " ticks");
            }
            return cycle;
        }
    }

    PhaseScheduler::PhaseScheduler(const CycleConfig &cycle)
        : config(checkedCycle(cycle)),
          cycle_length(static_cast<int>(cycle.cycleLength())),
          bike_red_at(cycle.bike_green_duration),
          car_green_at(cycle.bike_green_duration + cycle.all_red_duration),
          car_red_at(cycle.bike_green_duration + cycle.all_red_duration + cycle.car_green_duration)
    {
    }

    int PhaseScheduler::phaseTick(std::size_t tick) const
    {
        return static_cast<int>(tick % static_cast<std::size_t>(cycle_length));
    }

    std::vector<SignalTransition> PhaseScheduler::transitionsAt(std::size_t tick) const
    {
        const int phase_tick = phaseTick(tick);
        std::vector<SignalTransition> transitions;

        // Coinciding boundaries (zero-length phases) all fire, in this order
        if (phase_tick == 0)
        {
            transitions.push_back({LaneClass::Car, false});
            transitions.push_back({LaneClass::Bike, true});
        }
        if (phase_tick == bike_red_at)
        {
            transitions.push_back({LaneClass::Bike, false});
        }
        if (phase_tick == car_green_at)
        {
            transitions.push_back({LaneClass::Car, true});
        }
        if (phase_tick == car_red_at)
        {
            transitions.push_back({LaneClass::Car, false});
        }
        return transitions;
    }

    void PhaseScheduler::apply(std::size_t tick, std::vector<Lane> &lanes) const
    {
        for (const SignalTransition &transition : transitionsAt(tick))
        {
            for (Lane &lane : lanes)
            {
                if (lane.laneClass() == transition.lane_class)
                {
                    lane.setGreen(transition.green);
                }
            }
        }
    }

    PhaseScheduler::Phase PhaseScheduler::phaseAt(std::size_t tick) const
    {
        const int phase_tick = phaseTick(tick);
        if (phase_tick < bike_red_at)
        {
            return BIKE_GREEN;
        }
        if (phase_tick < car_green_at)
        {
            return ALL_RED_AFTER_BIKE;
        }
        if (phase_tick < car_red_at)
        {
            return CAR_GREEN;
        }
        return ALL_RED_AFTER_CAR;
    }

    SignalState PhaseScheduler::signalStateAt(std::size_t tick) const
    {
        SignalState state;
        switch (phaseAt(tick))
        {
        case BIKE_GREEN:
            state.bike_green = true;
            break;
        case CAR_GREEN:
            state.car_green = true;
            break;
        case ALL_RED_AFTER_BIKE:
        case ALL_RED_AFTER_CAR:
            break;
        }
        return state;
    }

    const char *toString(PhaseScheduler::Phase phase)
    {
        switch (phase)
        {
        case PhaseScheduler::BIKE_GREEN:
            return "bike_green";
        case PhaseScheduler::ALL_RED_AFTER_BIKE:
            return "all_red_after_bike";
        case PhaseScheduler::CAR_GREEN:
            return "car_green";
        case PhaseScheduler::ALL_RED_AFTER_CAR:
            return "all_red_after_car";
        }
        return "bike_green";
    }

} // namespace queuesim
