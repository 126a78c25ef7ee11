#pragma once

#include "Observation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace queuesim::db
{

    // Stores the configuration and observation table of finished runs
    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;
        bool saveRun(const std::string &config_json,
                     const std::vector<ObservationRow> &rows,
                     std::string *error = nullptr) const;
        std::optional<std::size_t> loadLatestRunTickCount(std::string *error = nullptr) const;

    private:
        std::string file_path;
    };

} // namespace queuesim::db
