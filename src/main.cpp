#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "ConfigLoader.hpp"
#include "QueueChart.hpp"
#include "ResultsTable.hpp"
#include "SimulationJson.hpp"
#include "SimulatorEngine.hpp"
#include "db/Database.hpp"

namespace
{
    struct CommandLine
    {
        std::string config_path = "config.json";
        std::string csv_path;
        std::string json_path;
        std::string db_path;
        bool draw_chart = true;
        bool show_help = false;
    };

    void printUsage(std::ostream &out)
    {
        out << "Usage: queuesim [config.json] [--csv FILE] [--json FILE] [--db FILE] [--no-chart]" << std::endl;
    }

    bool parseCommandLine(int argc, char **argv, CommandLine &cmd, std::string &error)
    {
        bool have_config = false;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            auto takeValue = [&](std::string &target)
            {
                if (i + 1 >= argc)
                {
                    error = arg + " needs a file argument";
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--help" || arg == "-h")
                cmd.show_help = true;
            else if (arg == "--no-chart")
                cmd.draw_chart = false;
            else if (arg == "--csv")
            {
                if (!takeValue(cmd.csv_path))
                    return false;
            }
            else if (arg == "--json")
            {
                if (!takeValue(cmd.json_path))
                    return false;
            }
            else if (arg == "--db")
            {
                if (!takeValue(cmd.db_path))
                    return false;
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                error = "unknown option " + arg;
                return false;
            }
            else if (!have_config)
            {
                cmd.config_path = arg;
                have_config = true;
            }
            else
            {
                error = "unexpected argument " + arg;
                return false;
            }
        }
        return true;
    }
}

int main(int argc, char **argv)
{
    CommandLine cmd;
    std::string arg_error;
    if (!parseCommandLine(argc, argv, cmd, arg_error))
    {
        std::cerr << "Error: " << arg_error << std::endl;
        printUsage(std::cerr);
        return 2;
    }
    if (cmd.show_help)
    {
        printUsage(std::cout);
        return 0;
    }

    std::cout << "=== Queue Simulator ===" << std::endl;
    std::cout << "Reading configuration file " << cmd.config_path << std::endl;

    queuesim::ConfigLoadResult loaded = queuesim::loadSimulationConfig(cmd.config_path);
    switch (loaded.status)
    {
    case queuesim::ConfigStatus::Loaded:
        if (loaded.used_default_lanes)
        {
            std::cerr << "Warning: no lanes configured, using default lane set" << std::endl;
        }
        break;
    case queuesim::ConfigStatus::Unreadable:
        for (const auto &error : loaded.errors)
        {
            std::cerr << "Warning: configuration unreadable: " << error << std::endl;
        }
        std::cerr << "Warning: using default configuration for simulation" << std::endl;
        break;
    case queuesim::ConfigStatus::Invalid:
        for (const auto &error : loaded.errors)
        {
            std::cerr << "Error: invalid configuration: " << error << std::endl;
        }
        return 2;
    }

    const queuesim::SimulationConfig &config = loaded.config;
    std::cout << "Cycle: bikes " << config.cycle.bike_green_duration
              << "s, all red " << config.cycle.all_red_duration
              << "s, cars " << config.cycle.car_green_duration
              << "s (" << config.cycle.cycleLength() << "s total), "
              << config.lanes.size() << " lanes, " << config.totalTicks() << " ticks" << std::endl;

    std::vector<queuesim::ObservationRow> rows;
    queuesim::SimulatorMetrics metrics;
    try
    {
        queuesim::SimulatorEngine engine(config);
        std::cout << "Running simulation..." << std::endl;
        rows = engine.run();
        metrics = engine.getMetrics();
    }
    catch (const queuesim::InvalidConfiguration &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    queuesim::ResultsTable table(rows);
    std::cout << std::endl;
    table.writeSummary(std::cout, metrics);

    if (cmd.draw_chart)
    {
        std::cout << std::endl;
        queuesim::QueueChart chart;
        chart.render(table, std::cout);
    }

    int exit_code = 0;
    if (!cmd.csv_path.empty())
    {
        std::string error;
        if (table.writeCsvFile(cmd.csv_path, &error))
            std::cout << "Wrote table to " << cmd.csv_path << std::endl;
        else
        {
            std::cerr << "Warning: " << error << std::endl;
            exit_code = 1;
        }
    }

    if (!cmd.json_path.empty())
    {
        std::ofstream out(cmd.json_path, std::ios::trunc);
        out << queuesim::observationsToJson(rows, metrics);
        if (out.good())
            std::cout << "Wrote observations to " << cmd.json_path << std::endl;
        else
        {
            std::cerr << "Warning: failed to write " << cmd.json_path << std::endl;
            exit_code = 1;
        }
    }

    if (!cmd.db_path.empty())
    {
        queuesim::db::Database database(cmd.db_path);
        std::string db_error;
        if (!database.initialize(&db_error) ||
            !database.saveRun(queuesim::simulationConfigToJson(config), rows, &db_error))
        {
            std::cerr << "Warning: failed to store run in database: " << db_error << std::endl;
            exit_code = 1;
        }
        else
        {
            std::cout << "Stored run in " << cmd.db_path << std::endl;
        }
    }

    return exit_code;
}
