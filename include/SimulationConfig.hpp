#pragma once

#include <cmath>
#include <climits>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace queuesim
{
    enum class LaneClass : uint8_t
    {
        Car = 0,
        Bike = 1
    };

    // Vehicles leaving a green lane per tick
    inline int dischargeRate(LaneClass lane_class)
    {
        switch (lane_class)
        {
        case LaneClass::Car:
            return 1;
        case LaneClass::Bike:
            return 2;
        }
        return 1;
    }

    // Upper bounds that keep queue counts and the tick range inside int and
    // size_t: a week of ticks at the maximum rate stays below INT_MAX vehicles
    constexpr double kMaxArrivalRate = 1000.0;
    constexpr double kMaxSimLengthHours = 168.0;
    constexpr long long kMaxCycleLength = INT_MAX;

    class InvalidConfiguration : public std::invalid_argument
    {
    public:
        explicit InvalidConfiguration(const std::string &what)
            : std::invalid_argument(what)
        {
        }
    };

    struct CycleConfig
    {
        int bike_green_duration = 10;
        int car_green_duration = 30;
        int all_red_duration = 10;

        // Widened so out-of-range durations are reported, not wrapped
        long long cycleLength() const
        {
            return static_cast<long long>(bike_green_duration) + car_green_duration + 2LL * all_red_duration;
        }
    };

    struct LaneDescriptor
    {
        LaneClass lane_class = LaneClass::Car;
        double arrival_rate = 0.1;
    };

    struct SimulationConfig
    {
        CycleConfig cycle{};
        double sim_length_hours = 0.1;
        std::vector<LaneDescriptor> lanes;
        std::optional<uint32_t> seed;

        std::size_t totalTicks() const
        {
            if (!(sim_length_hours > 0.0))
            {
                return 0;
            }
            const double hours = sim_length_hours < kMaxSimLengthHours ? sim_length_hours : kMaxSimLengthHours;
            return static_cast<std::size_t>(std::floor(3600.0 * hours));
        }
    };

    inline std::vector<LaneDescriptor> makeDefaultLanes()
    {
        // Two car lanes then two bike lanes, busiest first
        constexpr std::size_t kLaneCount = 4;
        std::vector<LaneDescriptor> lanes;
        for (std::size_t i = 0; i < kLaneCount; ++i)
        {
            LaneClass lane_class = i >= kLaneCount / 2 ? LaneClass::Bike : LaneClass::Car;
            lanes.push_back({lane_class, static_cast<double>(kLaneCount - i) * 0.1});
        }
        return lanes;
    }

    inline SimulationConfig makeDefaultSimulationConfig()
    {
        SimulationConfig config;
        config.cycle = CycleConfig{};
        config.sim_length_hours = 0.1;
        config.lanes = makeDefaultLanes();
        return config;
    }

} // namespace queuesim
