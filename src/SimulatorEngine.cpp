#include "SimulatorEngine.hpp"

#include <algorithm>
#include <utility>

namespace queuesim
{
    namespace
    {
        const SimulationConfig &checkedConfig(const SimulationConfig &config)
        {
            SafetyChecker checker;
            std::vector<std::string> errors = checker.validateConfig(config);
            if (!errors.empty())
            {
                std::string message = "invalid simulation config:";
                for (const auto &error : errors)
                {
                    message += " " + error + ";";
                }
                throw InvalidConfiguration(message);
            }
            return config;
        }

        std::vector<Lane> buildLanes(const std::vector<LaneDescriptor> &descriptors)
        {
            std::vector<Lane> lanes;
            lanes.reserve(descriptors.size());
            for (const auto &descriptor : descriptors)
            {
                lanes.emplace_back(descriptor);
            }
            return lanes;
        }

        std::unique_ptr<IArrivalSource> defaultArrivalSource(const SimulationConfig &config)
        {
            if (config.seed.has_value())
            {
                return std::make_unique<PoissonArrivalSource>(*config.seed);
            }
            return std::make_unique<PoissonArrivalSource>();
        }
    }

    SimulatorEngine::SimulatorEngine(const SimulationConfig &config, std::unique_ptr<IArrivalSource> arrivals)
        : SimulatorEngine(checkedConfig(config).cycle,
                          buildLanes(config.lanes),
                          config.totalTicks(),
                          arrivals ? std::move(arrivals) : defaultArrivalSource(config))
    {
    }

    SimulatorEngine::SimulatorEngine(const CycleConfig &cycle,
                                     std::vector<Lane> lanes,
                                     std::size_t total_ticks,
                                     std::unique_ptr<IArrivalSource> arrivals)
        : scheduler(cycle),
          lanes(std::move(lanes)),
          arrivals(std::move(arrivals)),
          total_ticks(total_ticks)
    {
        if (!this->arrivals)
        {
            throw InvalidConfiguration("simulator requires an arrival source");
        }
        peak_queue_lengths.assign(this->lanes.size(), 0);
        reset();
    }

    std::vector<ObservationRow> SimulatorEngine::run()
    {
        reset();
        std::vector<ObservationRow> rows;
        rows.reserve(total_ticks);
        while (current_tick < total_ticks)
        {
            rows.push_back(tick());
        }
        return rows;
    }

    ObservationRow SimulatorEngine::tick()
    {
        // Departures this tick depend on the signal set at this tick
        scheduler.apply(current_tick, lanes);

        if (!checker.isSafe(lanes))
        {
            safety_violations++;
        }

        for (std::size_t i = 0; i < lanes.size(); ++i)
        {
            QueueUpdate update = lanes[i].advanceQueue(*arrivals);
            recordUpdate(lanes[i], update);
            peak_queue_lengths[i] = std::max(peak_queue_lengths[i], lanes[i].queueLength());
        }

        ObservationRow row = snapshot();
        current_tick++;
        return row;
    }

    void SimulatorEngine::recordUpdate(const Lane &lane, const QueueUpdate &update)
    {
        if (lane.laneClass() == LaneClass::Car)
        {
            car_arrivals += static_cast<std::size_t>(update.arrivals);
            car_departures += static_cast<std::size_t>(update.departures);
            car_queue_sum += lane.queueLength();
        }
        else
        {
            bike_arrivals += static_cast<std::size_t>(update.arrivals);
            bike_departures += static_cast<std::size_t>(update.departures);
            bike_queue_sum += lane.queueLength();
        }
    }

    ObservationRow SimulatorEngine::snapshot() const
    {
        ObservationRow row;
        row.tick = current_tick;
        row.lanes.reserve(lanes.size());
        for (const Lane &lane : lanes)
        {
            row.lanes.push_back({lane.laneClass(), lane.isGreen(), lane.queueLength()});
        }
        return row;
    }

    void SimulatorEngine::reset()
    {
        current_tick = 0;
        for (Lane &lane : lanes)
        {
            lane.reset();
        }

        car_arrivals = 0;
        car_departures = 0;
        bike_arrivals = 0;
        bike_departures = 0;
        car_queue_sum = 0.0;
        bike_queue_sum = 0.0;
        safety_violations = 0;
        for (std::size_t i = 0; i < lanes.size(); ++i)
        {
            peak_queue_lengths[i] = lanes[i].queueLength();
        }
    }

    SimulatorMetrics SimulatorEngine::getMetrics() const
    {
        SimulatorMetrics metrics;
        metrics.ticks = current_tick;
        metrics.car_arrivals = car_arrivals;
        metrics.car_departures = car_departures;
        metrics.bike_arrivals = bike_arrivals;
        metrics.bike_departures = bike_departures;
        metrics.safety_violations = safety_violations;

        std::size_t car_lanes = 0;
        std::size_t bike_lanes = 0;
        for (const Lane &lane : lanes)
        {
            metrics.final_queue_lengths.push_back(lane.queueLength());
            if (lane.laneClass() == LaneClass::Car)
                car_lanes++;
            else
                bike_lanes++;
        }
        metrics.peak_queue_lengths = peak_queue_lengths;

        if (current_tick > 0 && car_lanes > 0)
        {
            metrics.mean_car_queue = car_queue_sum / static_cast<double>(current_tick * car_lanes);
        }
        if (current_tick > 0 && bike_lanes > 0)
        {
            metrics.mean_bike_queue = bike_queue_sum / static_cast<double>(current_tick * bike_lanes);
        }
        return metrics;
    }

} // namespace queuesim
