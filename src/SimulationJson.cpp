#include "SimulationJson.hpp"

#include <nlohmann/json.hpp>

#include <climits>
#include <cmath>
#include <cstdint>
#include <limits>

namespace queuesim
{
    namespace
    {
        using nlohmann::json;

        void readDuration(const json &root, const char *key, int &value, std::vector<std::string> &errors)
        {
            if (!root.contains(key))
            {
                return;
            }

            // Anything that does not fit an int is a shape error; negative
            // values that fit are left for validation to reject
            const json &field = root[key];
            if (field.is_number_unsigned())
            {
                const std::uint64_t raw = field.get<std::uint64_t>();
                if (raw <= static_cast<std::uint64_t>(INT_MAX))
                {
                    value = static_cast<int>(raw);
                    return;
                }
            }
            else if (field.is_number_integer())
            {
                const std::int64_t raw = field.get<std::int64_t>();
                if (raw >= INT_MIN && raw <= INT_MAX)
                {
                    value = static_cast<int>(raw);
                    return;
                }
            }
            else if (field.is_number_float())
            {
                const double raw = field.get<double>();
                if (std::isfinite(raw) && std::floor(raw) == raw &&
                    raw >= static_cast<double>(INT_MIN) && raw <= static_cast<double>(INT_MAX))
                {
                    value = static_cast<int>(raw);
                    return;
                }
            }

            errors.push_back(std::string(key) + " must be an integer number of seconds within int range");
        }

        bool readLane(const json &lane_json, std::size_t index, LaneDescriptor &lane, std::vector<std::string> &errors)
        {
            const std::string where = "lanes[" + std::to_string(index) + "]";
            if (!lane_json.is_object())
            {
                errors.push_back(where + " must be an object");
                return false;
            }

            if (!lane_json.contains("type") || !lane_json["type"].is_string() ||
                !laneClassFromString(lane_json["type"].get<std::string>(), lane.lane_class))
            {
                errors.push_back(where + ".type must be \"car\" or \"bike\"");
                return false;
            }

            if (!lane_json.contains("business") || !lane_json["business"].is_number())
            {
                errors.push_back(where + ".business must be a number");
                return false;
            }
            lane.arrival_rate = lane_json["business"].get<double>();
            return true;
        }
    }

    std::string laneClassToString(LaneClass lane_class)
    {
        switch (lane_class)
        {
        case LaneClass::Car:
            return "car";
        case LaneClass::Bike:
            return "bike";
        }
        return "car";
    }

    bool laneClassFromString(const std::string &value, LaneClass &lane_class)
    {
        if (value == "car")
        {
            lane_class = LaneClass::Car;
            return true;
        }
        if (value == "bike")
        {
            lane_class = LaneClass::Bike;
            return true;
        }
        return false;
    }

    std::string simulationConfigToJson(const SimulationConfig &config)
    {
        json root;
        root["GREEN_CARS"] = config.cycle.car_green_duration;
        root["GREEN_BIKES"] = config.cycle.bike_green_duration;
        root["RED_TIME_ALL"] = config.cycle.all_red_duration;
        root["SIM_LENGTH"] = config.sim_length_hours;
        if (config.seed.has_value())
        {
            root["SEED"] = *config.seed;
        }

        root["lanes"] = json::array();
        for (const auto &lane : config.lanes)
        {
            json lane_json;
            lane_json["type"] = laneClassToString(lane.lane_class);
            lane_json["business"] = lane.arrival_rate;
            root["lanes"].push_back(lane_json);
        }

        return root.dump(2);
    }

    ConfigParseResult simulationConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultSimulationConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        SimulationConfig parsed = makeDefaultSimulationConfig();
        readDuration(root, "GREEN_CARS", parsed.cycle.car_green_duration, result.errors);
        readDuration(root, "GREEN_BIKES", parsed.cycle.bike_green_duration, result.errors);
        readDuration(root, "RED_TIME_ALL", parsed.cycle.all_red_duration, result.errors);

        if (root.contains("SIM_LENGTH"))
        {
            if (root["SIM_LENGTH"].is_number())
            {
                parsed.sim_length_hours = root["SIM_LENGTH"].get<double>();
            }
            else
            {
                result.errors.push_back("SIM_LENGTH must be a number of hours");
            }
        }

        if (root.contains("SEED"))
        {
            if (root["SEED"].is_number_unsigned() &&
                root["SEED"].get<std::uint64_t>() <= std::numeric_limits<uint32_t>::max())
            {
                parsed.seed = static_cast<uint32_t>(root["SEED"].get<std::uint64_t>());
            }
            else
            {
                result.errors.push_back("SEED must be an integer in [0, 4294967295]");
            }
        }

        std::vector<LaneDescriptor> lanes;
        if (root.contains("lanes"))
        {
            const json &lanes_json = root["lanes"];
            if (!lanes_json.is_array())
            {
                result.errors.push_back("lanes must be an array");
            }
            else
            {
                for (std::size_t i = 0; i < lanes_json.size(); ++i)
                {
                    LaneDescriptor lane;
                    if (readLane(lanes_json[i], i, lane, result.errors))
                    {
                        lanes.push_back(lane);
                    }
                }
            }
        }

        if (!result.errors.empty())
        {
            return result;
        }

        if (lanes.empty())
        {
            result.used_default_lanes = true;
        }
        else
        {
            parsed.lanes = lanes;
        }

        result.config = parsed;
        result.ok = true;
        return result;
    }

    std::string observationsToJson(const std::vector<ObservationRow> &rows, const SimulatorMetrics &metrics)
    {
        json root;

        json metrics_json;
        metrics_json["ticks"] = metrics.ticks;
        metrics_json["car_arrivals"] = metrics.car_arrivals;
        metrics_json["car_departures"] = metrics.car_departures;
        metrics_json["bike_arrivals"] = metrics.bike_arrivals;
        metrics_json["bike_departures"] = metrics.bike_departures;
        metrics_json["mean_car_queue"] = metrics.mean_car_queue;
        metrics_json["mean_bike_queue"] = metrics.mean_bike_queue;
        metrics_json["final_queue_lengths"] = metrics.final_queue_lengths;
        metrics_json["peak_queue_lengths"] = metrics.peak_queue_lengths;
        metrics_json["safety_violations"] = metrics.safety_violations;
        root["metrics"] = metrics_json;

        root["rows"] = json::array();
        for (const auto &row : rows)
        {
            json row_json;
            row_json["tick"] = row.tick;
            row_json["lanes"] = json::array();
            for (const auto &lane : row.lanes)
            {
                json lane_json;
                lane_json["type"] = laneClassToString(lane.lane_class);
                lane_json["green"] = lane.signal_green;
                lane_json["queue"] = lane.queue_length;
                row_json["lanes"].push_back(lane_json);
            }
            root["rows"].push_back(row_json);
        }

        return root.dump();
    }

} // namespace queuesim
