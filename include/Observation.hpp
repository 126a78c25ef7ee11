#pragma once

#include "SimulationConfig.hpp"

#include <cstddef>
#include <vector>

namespace queuesim
{
    struct LaneRecord
    {
        LaneClass lane_class{LaneClass::Car};
        bool signal_green{false};
        int queue_length{0};
    };

    // One row per simulated tick, lanes in configuration order
    struct ObservationRow
    {
        std::size_t tick = 0;
        std::vector<LaneRecord> lanes;
    };

} // namespace queuesim
