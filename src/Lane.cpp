#include "Lane.hpp"

#include <cmath>
#include <string>

namespace queuesim
{
    namespace
    {
        double checkedArrivalRate(double rate)
        {
            if (!std::isfinite(rate) || rate <= 0.0)
            {
                throw InvalidConfiguration("lane arrival rate must be positive, got " + std::to_string(rate));
            }
            if (rate > kMaxArrivalRate)
            {
                throw InvalidConfiguration("lane arrival rate must not exceed " + std::to_string(kMaxArrivalRate) + ", got " + std::to_string(rate));
            }
            return rate;
        }

        int checkedInitialQueue(int queue)
        {
            if (queue < 0)
            {
                throw InvalidConfiguration("initial queue length must not be negative");
            }
            return queue;
        }
    }

    Lane::Lane(LaneClass lane_class, double arrival_rate, int initial_queue)
        : lane_class(lane_class),
          arrival_rate(checkedArrivalRate(arrival_rate)),
          initial_queue(checkedInitialQueue(initial_queue)),
          signal_green(false),
          queue_length(initial_queue)
    {
    }

    Lane::Lane(const LaneDescriptor &descriptor)
        : Lane(descriptor.lane_class, descriptor.arrival_rate)
    {
    }

    QueueUpdate Lane::advanceQueue(IArrivalSource &arrivals)
    {
        QueueUpdate update;

        // Arrivals join regardless of the signal
        int drawn = arrivals.draw(arrival_rate);
        update.arrivals = drawn > 0 ? drawn : 0;
        queue_length += update.arrivals;

        if (!signal_green || queue_length <= 0)
        {
            return update;
        }

        // Bikes leave in pairs; a lone bike leaves alone
        if (lane_class == LaneClass::Bike && queue_length == 1)
        {
            update.departures = 1;
        }
        else
        {
            update.departures = dischargeRate(lane_class);
        }
        queue_length -= update.departures;
        return update;
    }

    void Lane::reset()
    {
        signal_green = false;
        queue_length = initial_queue;
    }

} // namespace queuesim
