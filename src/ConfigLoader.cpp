#include "ConfigLoader.hpp"

#include "SafetyChecker.hpp"
#include "SimulationJson.hpp"

#include <fstream>
#include <iterator>

namespace queuesim
{

    ConfigLoadResult loadSimulationConfigFromText(const std::string &json_text)
    {
        ConfigLoadResult result;

        ConfigParseResult parsed = simulationConfigFromJson(json_text);
        if (!parsed.ok)
        {
            result.status = ConfigStatus::Unreadable;
            result.config = makeDefaultSimulationConfig();
            result.used_default_lanes = true;
            result.errors = parsed.errors;
            return result;
        }

        result.config = parsed.config;
        result.used_default_lanes = parsed.used_default_lanes;

        SafetyChecker checker;
        result.errors = checker.validateConfig(parsed.config);
        result.status = result.errors.empty() ? ConfigStatus::Loaded : ConfigStatus::Invalid;
        return result;
    }

    ConfigLoadResult loadSimulationConfig(const std::string &file_path)
    {
        std::ifstream in(file_path);
        if (!in.good())
        {
            ConfigLoadResult result;
            result.used_default_lanes = true;
            result.errors.push_back("file '" + file_path + "' was not found or could not be opened");
            return result;
        }

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return loadSimulationConfigFromText(content);
    }

    const char *toString(ConfigStatus status)
    {
        switch (status)
        {
        case ConfigStatus::Loaded:
            return "loaded";
        case ConfigStatus::Unreadable:
            return "unreadable";
        case ConfigStatus::Invalid:
            return "invalid";
        }
        return "unreadable";
    }

} // namespace queuesim
