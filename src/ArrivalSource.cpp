#include "ArrivalSource.hpp"

#include "SimulationConfig.hpp"

namespace queuesim
{
    PoissonArrivalSource::PoissonArrivalSource()
        : engine(std::random_device{}())
    {
    }

    PoissonArrivalSource::PoissonArrivalSource(uint32_t seed)
        : engine(seed)
    {
    }

    int PoissonArrivalSource::draw(double mean)
    {
        if (mean <= 0.0)
        {
            return 0;
        }
        std::poisson_distribution<int> dist(mean < kMaxArrivalRate ? mean : kMaxArrivalRate);
        return dist(engine);
    }

    void PoissonArrivalSource::reseed(uint32_t seed)
    {
        engine.seed(seed);
    }

} // namespace queuesim
