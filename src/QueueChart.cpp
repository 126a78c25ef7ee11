#include "QueueChart.hpp"

#include <algorithm>
#include <iomanip>
#include <string>
#include <vector>

namespace queuesim
{
    namespace
    {
        const std::string kSeriesSymbols = "*o+x#@%&";
    }

    QueueChart::QueueChart(const QueueChartOptions &options)
        : options(options)
    {
        this->options.width = std::max(1, this->options.width);
        this->options.height = std::max(2, this->options.height);
        this->options.y_max = std::max(1, this->options.y_max);
    }

    char QueueChart::seriesSymbol(std::size_t series_index)
    {
        return kSeriesSymbols[series_index % kSeriesSymbols.size()];
    }

    int QueueChart::levelFor(int value) const
    {
        const int clamped = std::min(std::max(value, 0), options.y_max);
        const int top = options.height - 1;
        return (clamped * top + options.y_max / 2) / options.y_max;
    }

    void QueueChart::render(const ResultsTable &table, std::ostream &out) const
    {
        out << "Length of the queue\n";
        if (table.size() == 0)
        {
            out << "(no observations)\n";
            return;
        }

        const std::vector<std::size_t> series = table.queueColumns();
        const auto &columns = table.columns();
        const std::size_t total = table.size();
        const int width = static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(options.width), total));

        std::vector<std::string> grid(static_cast<std::size_t>(options.height), std::string(static_cast<std::size_t>(width), ' '));
        std::string light_strip(static_cast<std::size_t>(width), '-');

        for (int column = 0; column < width; ++column)
        {
            const std::size_t begin = total * static_cast<std::size_t>(column) / static_cast<std::size_t>(width);
            const std::size_t end = total * static_cast<std::size_t>(column + 1) / static_cast<std::size_t>(width);

            std::vector<int> bucket_max(series.size(), 0);
            std::size_t bike_green = 0;
            std::size_t car_green = 0;
            for (std::size_t r = begin; r < end; ++r)
            {
                const ObservationRow &row = table.rows()[r];
                const std::vector<int> values = table.rowValues(row);
                for (std::size_t s = 0; s < series.size(); ++s)
                {
                    bucket_max[s] = std::max(bucket_max[s], values[series[s]]);
                }
                for (const auto &lane : row.lanes)
                {
                    if (!lane.signal_green)
                        continue;
                    if (lane.lane_class == LaneClass::Bike)
                        bike_green++;
                    else
                        car_green++;
                }
            }

            for (std::size_t s = 0; s < series.size(); ++s)
            {
                const int level = levelFor(bucket_max[s]);
                grid[static_cast<std::size_t>(options.height - 1 - level)][static_cast<std::size_t>(column)] = seriesSymbol(s);
            }

            if (bike_green > 0 && bike_green >= car_green)
                light_strip[static_cast<std::size_t>(column)] = 'B';
            else if (car_green > 0)
                light_strip[static_cast<std::size_t>(column)] = 'C';
        }

        const int top = options.height - 1;
        for (int row = 0; row < options.height; ++row)
        {
            const int level = top - row;
            const int label = (level * options.y_max + top / 2) / top;
            out << std::setw(4) << label << " |" << grid[static_cast<std::size_t>(row)] << "\n";
        }
        out << "     +" << std::string(static_cast<std::size_t>(width), '-') << "\n";
        out << "green" << " " << light_strip << "\n";
        out << "      tick 0 .. " << (total - 1) << "\n";

        for (std::size_t s = 0; s < series.size(); ++s)
        {
            out << "  " << seriesSymbol(s) << " " << columns[series[s]] << "\n";
        }
    }

} // namespace queuesim
