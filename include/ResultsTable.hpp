#pragma once

#include "Observation.hpp"
#include "SimulatorEngine.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace queuesim
{
    // Column layout: bikelight, Bikes 1..n, carlight, Cars 1..n. The light
    // column of a class follows its first lane; a class with no lanes has no
    // columns at all.
    class ResultsTable
    {
    public:
        explicit ResultsTable(std::vector<ObservationRow> rows);

        const std::vector<std::string> &columns() const { return column_names; }
        const std::vector<ObservationRow> &rows() const { return observation_rows; }
        std::size_t size() const { return observation_rows.size(); }

        // Values for one row in column order, lights as 0/1
        std::vector<int> rowValues(const ObservationRow &row) const;

        // Indices into columns() that hold queue lengths rather than lights
        std::vector<std::size_t> queueColumns() const;

        void writeCsv(std::ostream &out) const;
        bool writeCsvFile(const std::string &file_path, std::string *error = nullptr) const;

        void writeSummary(std::ostream &out, const SimulatorMetrics &metrics) const;

    private:
        std::vector<ObservationRow> observation_rows;
        std::vector<std::size_t> bike_lanes;
        std::vector<std::size_t> car_lanes;
        std::vector<std::string> column_names;
    };

} // namespace queuesim
