#pragma once

#include "ResultsTable.hpp"

#include <ostream>

namespace queuesim
{
    struct QueueChartOptions
    {
        int width = 72;
        int height = 12;
        int y_max = 25; // queues above this are drawn on the top row
    };

    // Text line chart of every queue column in a results table
    class QueueChart
    {
    public:
        explicit QueueChart(const QueueChartOptions &options = {});

        void render(const ResultsTable &table, std::ostream &out) const;

        static char seriesSymbol(std::size_t series_index);

    private:
        int levelFor(int value) const;

        QueueChartOptions options;
    };

} // namespace queuesim
