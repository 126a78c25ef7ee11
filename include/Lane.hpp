#pragma once

#include "ArrivalSource.hpp"
#include "SimulationConfig.hpp"

namespace queuesim
{
    struct QueueUpdate
    {
        int arrivals = 0;
        int departures = 0;
    };

    class Lane
    {
    public:
        // Throws InvalidConfiguration unless arrival_rate is finite and positive
        Lane(LaneClass lane_class, double arrival_rate, int initial_queue = 0);
        explicit Lane(const LaneDescriptor &descriptor);

        // Add this tick's arrivals, then discharge if the signal is green
        QueueUpdate advanceQueue(IArrivalSource &arrivals);

        LaneClass laneClass() const { return lane_class; }
        double arrivalRate() const { return arrival_rate; }
        int queueLength() const { return queue_length; }
        bool isGreen() const { return signal_green; }

        void setGreen(bool green) { signal_green = green; }

        // Back to the queue length given at construction, signal red
        void reset();

    private:
        LaneClass lane_class;
        double arrival_rate;
        int initial_queue;
        bool signal_green;
        int queue_length;
    };

} // namespace queuesim
