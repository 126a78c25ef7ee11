#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <memory>
#include "Lane.hpp"
#include "PhaseScheduler.hpp"
#include "SafetyChecker.hpp"
#include "SimulatorEngine.hpp"
#include "TestArrivalSources.hpp"

#include <cmath>
#include <limits>

using namespace queuesim;
using queuesim::test::ScriptedArrivals;
using queuesim::test::ZeroArrivals;

namespace
{
    CycleConfig defaultCycle()
    {
        CycleConfig cycle;
        cycle.bike_green_duration = 10;
        cycle.all_red_duration = 10;
        cycle.car_green_duration = 30;
        return cycle;
    }

    // Car green from tick 0 for the whole cycle
    CycleConfig carOnlyCycle(int car_green)
    {
        CycleConfig cycle;
        cycle.bike_green_duration = 0;
        cycle.all_red_duration = 0;
        cycle.car_green_duration = car_green;
        return cycle;
    }
}

TEST_CASE("Car lane drains one vehicle per green tick", "[lane]")
{
    Lane lane(LaneClass::Car, 0.5, 5);
    lane.setGreen(true);
    ZeroArrivals arrivals;

    std::vector<int> sequence;
    for (int i = 0; i < 5; ++i)
    {
        lane.advanceQueue(arrivals);
        sequence.push_back(lane.queueLength());
    }

    REQUIRE(sequence == std::vector<int>{4, 3, 2, 1, 0});
}

TEST_CASE("Bike lane with a single bike drops to zero", "[lane][bike]")
{
    Lane lane(LaneClass::Bike, 0.5, 1);
    lane.setGreen(true);
    ZeroArrivals arrivals;

    QueueUpdate update = lane.advanceQueue(arrivals);
    REQUIRE(lane.queueLength() == 0);
    REQUIRE(update.departures == 1);
}

TEST_CASE("Bike lane floor counts this tick's arrivals", "[lane][bike]")
{
    // Empty lane, one bike arrives on green: it leaves alone, never -1
    Lane lane(LaneClass::Bike, 0.5, 0);
    lane.setGreen(true);
    ScriptedArrivals arrivals({1});

    QueueUpdate update = lane.advanceQueue(arrivals);
    REQUIRE(update.arrivals == 1);
    REQUIRE(update.departures == 1);
    REQUIRE(lane.queueLength() == 0);
}

TEST_CASE("Bike lane departs in pairs above one", "[lane][bike]")
{
    Lane lane(LaneClass::Bike, 0.5, 3);
    lane.setGreen(true);
    ZeroArrivals arrivals;

    lane.advanceQueue(arrivals);
    REQUIRE(lane.queueLength() == 1);
    lane.advanceQueue(arrivals);
    REQUIRE(lane.queueLength() == 0);
    lane.advanceQueue(arrivals);
    REQUIRE(lane.queueLength() == 0);
}

TEST_CASE("Red lane only accumulates arrivals", "[lane]")
{
    Lane lane(LaneClass::Car, 1.0, 2);
    ScriptedArrivals arrivals({3, 0, 1});

    lane.advanceQueue(arrivals);
    lane.advanceQueue(arrivals);
    lane.advanceQueue(arrivals);

    REQUIRE_FALSE(lane.isGreen());
    REQUIRE(lane.queueLength() == 6);
}

TEST_CASE("Green car lane with arrivals nets out", "[lane]")
{
    Lane lane(LaneClass::Car, 1.0, 0);
    lane.setGreen(true);
    ScriptedArrivals arrivals({3});

    QueueUpdate update = lane.advanceQueue(arrivals);
    REQUIRE(update.arrivals == 3);
    REQUIRE(update.departures == 1);
    REQUIRE(lane.queueLength() == 2);
}

TEST_CASE("Lane rejects non-positive arrival rates", "[lane][config]")
{
    REQUIRE_THROWS_AS(Lane(LaneClass::Car, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(Lane(LaneClass::Bike, -0.3), InvalidConfiguration);
    REQUIRE_THROWS_AS(Lane(LaneClass::Car, std::numeric_limits<double>::quiet_NaN()), InvalidConfiguration);
    REQUIRE_THROWS_AS(Lane(LaneClass::Car, 0.2, -1), InvalidConfiguration);
    REQUIRE_NOTHROW(Lane(LaneClass::Bike, 0.01));
}

TEST_CASE("Lane reset restores initial queue and red signal", "[lane]")
{
    Lane lane(LaneClass::Car, 0.5, 4);
    lane.setGreen(true);
    ScriptedArrivals arrivals({7});
    lane.advanceQueue(arrivals);
    REQUIRE(lane.queueLength() == 10);

    lane.reset();
    REQUIRE(lane.queueLength() == 4);
    REQUIRE_FALSE(lane.isGreen());
}

TEST_CASE("Discharge rate lookup per class", "[lane]")
{
    REQUIRE(dischargeRate(LaneClass::Car) == 1);
    REQUIRE(dischargeRate(LaneClass::Bike) == 2);
}

TEST_CASE("PhaseScheduler follows the default cycle boundaries", "[scheduler]")
{
    PhaseScheduler scheduler(defaultCycle());
    REQUIRE(scheduler.cycleLength() == 60);

    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.3);
    lanes.emplace_back(LaneClass::Bike, 0.3);
    Lane &car = lanes[0];
    Lane &bike = lanes[1];

    auto applyThrough = [&](std::size_t from, std::size_t to)
    {
        for (std::size_t t = from; t <= to; ++t)
            scheduler.apply(t, lanes);
    };

    applyThrough(0, 0);
    REQUIRE(bike.isGreen());
    REQUIRE_FALSE(car.isGreen());

    applyThrough(1, 10);
    REQUIRE_FALSE(bike.isGreen());
    REQUIRE_FALSE(car.isGreen());

    applyThrough(11, 20);
    REQUIRE_FALSE(bike.isGreen());
    REQUIRE(car.isGreen());

    applyThrough(21, 50);
    REQUIRE_FALSE(bike.isGreen());
    REQUIRE_FALSE(car.isGreen());

    applyThrough(51, 60);
    REQUIRE(bike.isGreen());
    REQUIRE_FALSE(car.isGreen());
}

TEST_CASE("PhaseScheduler holds state between boundaries", "[scheduler]")
{
    PhaseScheduler scheduler(defaultCycle());
    REQUIRE(scheduler.transitionsAt(5).empty());
    REQUIRE(scheduler.transitionsAt(35).empty());
    REQUIRE(scheduler.transitionsAt(59).empty());

    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.3);
    lanes[0].setGreen(true);
    scheduler.apply(5, lanes);
    REQUIRE(lanes[0].isGreen());
}

TEST_CASE("PhaseScheduler only touches lanes of the matching class", "[scheduler]")
{
    PhaseScheduler scheduler(defaultCycle());
    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.3);
    lanes.emplace_back(LaneClass::Bike, 0.3);
    lanes[1].setGreen(true);

    // Car-green boundary must leave the bike lane alone
    scheduler.apply(20, lanes);
    REQUIRE(lanes[0].isGreen());
    REQUIRE(lanes[1].isGreen());

    auto transitions = scheduler.transitionsAt(20);
    REQUIRE(transitions.size() == 1);
    REQUIRE(transitions[0].lane_class == LaneClass::Car);
    REQUIRE(transitions[0].green);
}

TEST_CASE("PhaseScheduler transitions repeat every cycle", "[scheduler][periodic]")
{
    CycleConfig cycle;
    cycle.bike_green_duration = 7;
    cycle.all_red_duration = 3;
    cycle.car_green_duration = 19;
    PhaseScheduler scheduler(cycle);
    const std::size_t length = static_cast<std::size_t>(scheduler.cycleLength());

    for (std::size_t t = 0; t < 3 * length; ++t)
    {
        auto now = scheduler.transitionsAt(t);
        auto later = scheduler.transitionsAt(t + length);
        REQUIRE(now.size() == later.size());
        for (std::size_t i = 0; i < now.size(); ++i)
        {
            REQUIRE(now[i].lane_class == later[i].lane_class);
            REQUIRE(now[i].green == later[i].green);
        }
        REQUIRE(scheduler.phaseAt(t) == scheduler.phaseAt(t + length));
    }
}

TEST_CASE("PhaseScheduler names phases and derives signal state", "[scheduler]")
{
    PhaseScheduler scheduler(defaultCycle());
    REQUIRE(scheduler.phaseAt(0) == PhaseScheduler::BIKE_GREEN);
    REQUIRE(scheduler.phaseAt(9) == PhaseScheduler::BIKE_GREEN);
    REQUIRE(scheduler.phaseAt(10) == PhaseScheduler::ALL_RED_AFTER_BIKE);
    REQUIRE(scheduler.phaseAt(20) == PhaseScheduler::CAR_GREEN);
    REQUIRE(scheduler.phaseAt(49) == PhaseScheduler::CAR_GREEN);
    REQUIRE(scheduler.phaseAt(50) == PhaseScheduler::ALL_RED_AFTER_CAR);
    REQUIRE(scheduler.phaseAt(60) == PhaseScheduler::BIKE_GREEN);
    REQUIRE(std::string(toString(PhaseScheduler::CAR_GREEN)) == "car_green");

    SignalState red = scheduler.signalStateAt(55);
    REQUIRE_FALSE(red.car_green);
    REQUIRE_FALSE(red.bike_green);
    REQUIRE(scheduler.signalStateAt(25).car_green);
    REQUIRE(scheduler.signalStateAt(3).bike_green);
}

TEST_CASE("PhaseScheduler applies coinciding boundaries in order", "[scheduler][edge]")
{
    SECTION("zero bike green keeps bikes red")
    {
        CycleConfig cycle;
        cycle.bike_green_duration = 0;
        cycle.all_red_duration = 5;
        cycle.car_green_duration = 10;
        PhaseScheduler scheduler(cycle);

        std::vector<Lane> lanes;
        lanes.emplace_back(LaneClass::Bike, 0.3);
        for (std::size_t t = 0; t < 40; ++t)
        {
            scheduler.apply(t, lanes);
            REQUIRE_FALSE(lanes[0].isGreen());
            REQUIRE_FALSE(scheduler.signalStateAt(t).bike_green);
        }
    }

    SECTION("zero car green keeps cars red")
    {
        CycleConfig cycle;
        cycle.bike_green_duration = 4;
        cycle.all_red_duration = 2;
        cycle.car_green_duration = 0;
        PhaseScheduler scheduler(cycle);

        std::vector<Lane> lanes;
        lanes.emplace_back(LaneClass::Car, 0.3);
        for (std::size_t t = 0; t < 40; ++t)
        {
            scheduler.apply(t, lanes);
            REQUIRE_FALSE(lanes[0].isGreen());
        }
    }
}

TEST_CASE("PhaseScheduler rejects unusable cycles", "[scheduler][config]")
{
    CycleConfig empty;
    empty.bike_green_duration = 0;
    empty.all_red_duration = 0;
    empty.car_green_duration = 0;
    REQUIRE_THROWS_AS(PhaseScheduler(empty), InvalidConfiguration);

    CycleConfig negative = defaultCycle();
    negative.all_red_duration = -1;
    REQUIRE_THROWS_AS(PhaseScheduler(negative), InvalidConfiguration);
}

TEST_CASE("SafetyChecker flags car and bike green together", "[safety]")
{
    SafetyChecker checker;
    REQUIRE(checker.isSafe(SignalState{false, false}));
    REQUIRE(checker.isSafe(SignalState{true, false}));
    REQUIRE(checker.isSafe(SignalState{false, true}));
    REQUIRE_FALSE(checker.isSafe(SignalState{true, true}));

    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.3);
    lanes.emplace_back(LaneClass::Bike, 0.3);
    lanes[0].setGreen(true);
    REQUIRE(checker.isSafe(lanes));
    lanes[1].setGreen(true);
    REQUIRE_FALSE(checker.isSafe(lanes));
}

TEST_CASE("SimulatorEngine drains a green car lane", "[engine][scenario]")
{
    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.5, 5);
    SimulatorEngine engine(carOnlyCycle(10), std::move(lanes), 5, std::make_unique<ZeroArrivals>());

    auto rows = engine.run();
    REQUIRE(rows.size() == 5);

    std::vector<int> sequence;
    for (const auto &row : rows)
    {
        REQUIRE(row.lanes.size() == 1);
        REQUIRE(row.lanes[0].signal_green);
        sequence.push_back(row.lanes[0].queue_length);
    }
    REQUIRE(sequence == std::vector<int>{4, 3, 2, 1, 0});
}

TEST_CASE("SimulatorEngine applies bike floor on the first green tick", "[engine][scenario][bike]")
{
    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Bike, 0.5, 1);
    SimulatorEngine engine(defaultCycle(), std::move(lanes), 1, std::make_unique<ZeroArrivals>());

    auto rows = engine.run();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].lanes[0].signal_green);
    REQUIRE(rows[0].lanes[0].queue_length == 0);
}

TEST_CASE("SimulatorEngine signal sequence is fixed by the schedule", "[engine][determinism]")
{
    std::vector<Lane> lanes;
    for (const auto &descriptor : makeDefaultLanes())
    {
        lanes.emplace_back(descriptor);
    }
    SimulatorEngine engine(defaultCycle(), std::move(lanes), 120, std::make_unique<ZeroArrivals>());
    const PhaseScheduler &scheduler = engine.getScheduler();

    auto rows = engine.run();
    REQUIRE(rows.size() == 120);
    for (const auto &row : rows)
    {
        SignalState expected = scheduler.signalStateAt(row.tick);
        for (const auto &lane : row.lanes)
        {
            bool expected_green = lane.lane_class == LaneClass::Car ? expected.car_green : expected.bike_green;
            REQUIRE(lane.signal_green == expected_green);
            REQUIRE(lane.queue_length == 0);
        }
    }
}

TEST_CASE("SimulatorEngine keeps signals exclusive and queues non-negative", "[engine][safety]")
{
    SimulationConfig config = makeDefaultSimulationConfig();
    config.sim_length_hours = 1.0;
    config.seed = 1234u;
    config.lanes.push_back({LaneClass::Bike, 3.5});
    config.lanes.push_back({LaneClass::Car, 2.0});
    SimulatorEngine engine(config);

    auto rows = engine.run();
    REQUIRE(rows.size() == 3600);

    const PhaseScheduler &scheduler = engine.getScheduler();
    for (const auto &row : rows)
    {
        bool car_green = false;
        bool bike_green = false;
        for (const auto &lane : row.lanes)
        {
            REQUIRE(lane.queue_length >= 0);
            if (lane.lane_class == LaneClass::Car)
                car_green = car_green || lane.signal_green;
            else
                bike_green = bike_green || lane.signal_green;
        }
        REQUIRE_FALSE((car_green && bike_green));

        auto phase = scheduler.phaseAt(row.tick);
        if (phase == PhaseScheduler::ALL_RED_AFTER_BIKE || phase == PhaseScheduler::ALL_RED_AFTER_CAR)
        {
            REQUIRE_FALSE(car_green);
            REQUIRE_FALSE(bike_green);
        }
    }

    SimulatorMetrics metrics = engine.getMetrics();
    REQUIRE(metrics.ticks == 3600);
    REQUIRE(metrics.safety_violations == 0);
    REQUIRE(metrics.final_queue_lengths.size() == 6);
    REQUIRE(metrics.car_arrivals >= metrics.car_departures);
    REQUIRE(metrics.bike_arrivals >= metrics.bike_departures);
}

TEST_CASE("SimulatorEngine with the same seed repeats its run", "[engine][determinism]")
{
    SimulationConfig config = makeDefaultSimulationConfig();
    config.seed = 42u;

    SimulatorEngine first(config);
    SimulatorEngine second(config);
    auto a = first.run();
    auto b = second.run();

    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        for (std::size_t lane = 0; lane < a[i].lanes.size(); ++lane)
        {
            REQUIRE(a[i].lanes[lane].queue_length == b[i].lanes[lane].queue_length);
        }
    }
}

TEST_CASE("SimulatorEngine tick and reset", "[engine]")
{
    std::vector<Lane> lanes;
    lanes.emplace_back(LaneClass::Car, 0.5, 2);
    lanes.emplace_back(LaneClass::Bike, 0.5, 3);
    SimulatorEngine engine(defaultCycle(), std::move(lanes), 60, std::make_unique<ScriptedArrivals>(std::deque<int>{1, 1}));

    ObservationRow row = engine.tick();
    REQUIRE(row.tick == 0);
    REQUIRE(engine.currentTick() == 1);
    REQUIRE(row.lanes[0].queue_length == 3); // car red
    REQUIRE(row.lanes[1].queue_length == 2); // bike green, pair leaves

    SimulatorMetrics metrics = engine.getMetrics();
    REQUIRE(metrics.car_arrivals == 1);
    REQUIRE(metrics.bike_departures == 2);
    REQUIRE(metrics.peak_queue_lengths == std::vector<int>{3, 3});

    engine.reset();
    REQUIRE(engine.currentTick() == 0);
    REQUIRE(engine.getLanes()[0].queueLength() == 2);
    REQUIRE(engine.getLanes()[1].queueLength() == 3);
    REQUIRE(engine.getMetrics().car_arrivals == 0);
}

TEST_CASE("SimulatorEngine rejects invalid configs before running", "[engine][config]")
{
    SimulationConfig bad_rate = makeDefaultSimulationConfig();
    bad_rate.lanes[2].arrival_rate = 0.0;
    REQUIRE_THROWS_AS(SimulatorEngine(bad_rate), InvalidConfiguration);

    SimulationConfig bad_cycle = makeDefaultSimulationConfig();
    bad_cycle.cycle.car_green_duration = -5;
    REQUIRE_THROWS_AS(SimulatorEngine(bad_cycle), InvalidConfiguration);

    SimulationConfig bad_length = makeDefaultSimulationConfig();
    bad_length.sim_length_hours = -1.0;
    REQUIRE_THROWS_AS(SimulatorEngine(bad_length), InvalidConfiguration);
}

TEST_CASE("Overflowing cycles and huge values are rejected at construction", "[engine][config][limits]")
{
    CycleConfig overflow;
    overflow.bike_green_duration = std::numeric_limits<int>::max();
    overflow.car_green_duration = std::numeric_limits<int>::max();
    overflow.all_red_duration = 2;
    REQUIRE_THROWS_AS(PhaseScheduler(overflow), InvalidConfiguration);

    SafetyChecker checker;
    SimulationConfig config = makeDefaultSimulationConfig();
    config.cycle = overflow;
    REQUIRE_FALSE(checker.isConfigValid(config));
    REQUIRE_THROWS_AS(SimulatorEngine(config), InvalidConfiguration);

    SimulationConfig long_run = makeDefaultSimulationConfig();
    long_run.sim_length_hours = 1e12;
    REQUIRE_FALSE(checker.isConfigValid(long_run));
    REQUIRE_THROWS_AS(SimulatorEngine(long_run), InvalidConfiguration);

    REQUIRE_THROWS_AS(Lane(LaneClass::Car, kMaxArrivalRate * 2.0), InvalidConfiguration);
    REQUIRE_NOTHROW(Lane(LaneClass::Car, kMaxArrivalRate));
}

TEST_CASE("Cycle at the int limit keeps its boundaries", "[scheduler][limits]")
{
    CycleConfig cycle;
    cycle.bike_green_duration = std::numeric_limits<int>::max() - 2;
    cycle.car_green_duration = 0;
    cycle.all_red_duration = 1;
    PhaseScheduler scheduler(cycle);

    REQUIRE(scheduler.cycleLength() == std::numeric_limits<int>::max());
    REQUIRE(scheduler.phaseAt(0) == PhaseScheduler::BIKE_GREEN);
    REQUIRE(scheduler.phaseAt(static_cast<std::size_t>(cycle.bike_green_duration)) == PhaseScheduler::ALL_RED_AFTER_BIKE);
}
