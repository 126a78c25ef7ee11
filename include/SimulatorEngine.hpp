#pragma once

#include "ArrivalSource.hpp"
#include "Lane.hpp"
#include "Observation.hpp"
#include "PhaseScheduler.hpp"
#include "SafetyChecker.hpp"
#include "SimulationConfig.hpp"

#include <memory>
#include <vector>

namespace queuesim
{
    struct SimulatorMetrics
    {
        std::size_t ticks = 0;
        std::size_t car_arrivals = 0;
        std::size_t car_departures = 0;
        std::size_t bike_arrivals = 0;
        std::size_t bike_departures = 0;
        double mean_car_queue = 0.0;
        double mean_bike_queue = 0.0;
        std::vector<int> final_queue_lengths; // per lane, configuration order
        std::vector<int> peak_queue_lengths;  // per lane, configuration order
        std::size_t safety_violations = 0;
    };

    class SimulatorEngine
    {
    public:
        // Builds lanes from the config; without an arrival source a Poisson
        // source is seeded from config.seed or std::random_device.
        // Throws InvalidConfiguration on out-of-range values.
        explicit SimulatorEngine(const SimulationConfig &config,
                                 std::unique_ptr<IArrivalSource> arrivals = nullptr);

        SimulatorEngine(const CycleConfig &cycle,
                        std::vector<Lane> lanes,
                        std::size_t total_ticks,
                        std::unique_ptr<IArrivalSource> arrivals);

        // Reset, then simulate every tick in [0, total_ticks)
        std::vector<ObservationRow> run();

        // Advance a single tick and return its observation
        ObservationRow tick();

        void reset();

        std::size_t currentTick() const { return current_tick; }
        std::size_t totalTicks() const { return total_ticks; }
        const std::vector<Lane> &getLanes() const { return lanes; }
        const PhaseScheduler &getScheduler() const { return scheduler; }
        SimulatorMetrics getMetrics() const;

    private:
        ObservationRow snapshot() const;
        void recordUpdate(const Lane &lane, const QueueUpdate &update);

        PhaseScheduler scheduler;
        SafetyChecker checker;
        std::vector<Lane> lanes;
        std::unique_ptr<IArrivalSource> arrivals;
        std::size_t total_ticks;
        std::size_t current_tick = 0;

        std::size_t car_arrivals = 0;
        std::size_t car_departures = 0;
        std::size_t bike_arrivals = 0;
        std::size_t bike_departures = 0;
        double car_queue_sum = 0.0;
        double bike_queue_sum = 0.0;
        std::vector<int> peak_queue_lengths;
        std::size_t safety_violations = 0;
    };

} // namespace queuesim
