#pragma once

#include <cstdint>
#include <random>

namespace queuesim
{
    class IArrivalSource
    {
    public:
        virtual ~IArrivalSource() = default;

        // Number of vehicles joining a lane this tick for the given mean
        virtual int draw(double mean) = 0;
    };

    class PoissonArrivalSource : public IArrivalSource
    {
    public:
        PoissonArrivalSource();
        explicit PoissonArrivalSource(uint32_t seed);

        int draw(double mean) override;
        void reseed(uint32_t seed);

    private:
        std::mt19937 engine;
    };

} // namespace queuesim
