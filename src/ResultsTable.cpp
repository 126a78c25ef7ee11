#include "ResultsTable.hpp"

#include <fstream>
#include <iomanip>
#include <utility>

namespace queuesim
{

    ResultsTable::ResultsTable(std::vector<ObservationRow> rows)
        : observation_rows(std::move(rows))
    {
        if (!observation_rows.empty())
        {
            const auto &first = observation_rows.front();
            for (std::size_t i = 0; i < first.lanes.size(); ++i)
            {
                if (first.lanes[i].lane_class == LaneClass::Bike)
                    bike_lanes.push_back(i);
                else
                    car_lanes.push_back(i);
            }
        }

        if (!bike_lanes.empty())
        {
            column_names.push_back("bikelight");
            for (std::size_t i = 0; i < bike_lanes.size(); ++i)
            {
                column_names.push_back("Bikes " + std::to_string(i + 1));
            }
        }
        if (!car_lanes.empty())
        {
            column_names.push_back("carlight");
            for (std::size_t i = 0; i < car_lanes.size(); ++i)
            {
                column_names.push_back("Cars " + std::to_string(i + 1));
            }
        }
    }

    std::vector<int> ResultsTable::rowValues(const ObservationRow &row) const
    {
        std::vector<int> values;
        values.reserve(column_names.size());

        auto appendClass = [&](const std::vector<std::size_t> &indices)
        {
            if (indices.empty())
            {
                return;
            }
            values.push_back(row.lanes[indices.front()].signal_green ? 1 : 0);
            for (std::size_t index : indices)
            {
                values.push_back(row.lanes[index].queue_length);
            }
        };

        appendClass(bike_lanes);
        appendClass(car_lanes);
        return values;
    }

    std::vector<std::size_t> ResultsTable::queueColumns() const
    {
        std::vector<std::size_t> indices;
        for (std::size_t i = 0; i < column_names.size(); ++i)
        {
            if (column_names[i] != "bikelight" && column_names[i] != "carlight")
            {
                indices.push_back(i);
            }
        }
        return indices;
    }

    void ResultsTable::writeCsv(std::ostream &out) const
    {
        out << "tick";
        for (const auto &name : column_names)
        {
            out << "," << name;
        }
        out << "\n";

        for (const auto &row : observation_rows)
        {
            out << row.tick;
            for (int value : rowValues(row))
            {
                out << "," << value;
            }
            out << "\n";
        }
    }

    bool ResultsTable::writeCsvFile(const std::string &file_path, std::string *error) const
    {
        std::ofstream out(file_path, std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open '" + file_path + "' for writing";
            }
            return false;
        }

        writeCsv(out);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to write '" + file_path + "'";
            }
            return false;
        }
        return true;
    }

    void ResultsTable::writeSummary(std::ostream &out, const SimulatorMetrics &metrics) const
    {
        out << "Simulated ticks:   " << metrics.ticks << "\n";
        out << "Car arrivals:      " << metrics.car_arrivals << " (departed " << metrics.car_departures << ")\n";
        out << "Bike arrivals:     " << metrics.bike_arrivals << " (departed " << metrics.bike_departures << ")\n";
        out << std::fixed << std::setprecision(2);
        out << "Mean car queue:    " << metrics.mean_car_queue << "\n";
        out << "Mean bike queue:   " << metrics.mean_bike_queue << "\n";
        out << std::defaultfloat;
        out << "Safety violations: " << metrics.safety_violations << "\n";

        // Per-lane lines use the same names as the table columns
        auto laneLine = [&](const std::string &name, std::size_t lane_index)
        {
            if (lane_index >= metrics.final_queue_lengths.size() || lane_index >= metrics.peak_queue_lengths.size())
            {
                return;
            }
            out << "  " << std::left << std::setw(10) << name << std::right
                << " final " << std::setw(4) << metrics.final_queue_lengths[lane_index]
                << "  peak " << std::setw(4) << metrics.peak_queue_lengths[lane_index] << "\n";
        };

        for (std::size_t i = 0; i < bike_lanes.size(); ++i)
        {
            laneLine("Bikes " + std::to_string(i + 1), bike_lanes[i]);
        }
        for (std::size_t i = 0; i < car_lanes.size(); ++i)
        {
            laneLine("Cars " + std::to_string(i + 1), car_lanes[i]);
        }
    }

} // namespace queuesim
