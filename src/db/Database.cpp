#include "Database.hpp"

#include "SimulationJson.hpp"

#ifdef QUEUESIM_USE_SQLITE
#include <sqlite3.h>
#else
#include <fstream>
#endif

#include <utility>

namespace queuesim::db
{
#ifdef QUEUESIM_USE_SQLITE
    namespace
    {
        bool execSql(sqlite3 *handle, const char *sql, std::string *error)
        {
            char *errmsg = nullptr;
            const int rc = sqlite3_exec(handle, sql, nullptr, nullptr, &errmsg);
            if (rc != SQLITE_OK)
            {
                if (error)
                {
                    *error = errmsg ? errmsg : "sqlite statement failed";
                }
                sqlite3_free(errmsg);
                return false;
            }
            return true;
        }

        sqlite3 *openHandle(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = handle ? sqlite3_errmsg(handle) : "failed to open database";
                }
                sqlite3_close(handle);
                return nullptr;
            }
            return handle;
        }
    }
#endif

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
#ifdef QUEUESIM_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS runs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,"
            "config TEXT NOT NULL,"
            "ticks INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS observations ("
            "run_id INTEGER NOT NULL REFERENCES runs(id),"
            "tick INTEGER NOT NULL,"
            "lane_index INTEGER NOT NULL,"
            "lane_type TEXT NOT NULL,"
            "green INTEGER NOT NULL,"
            "queue_length INTEGER NOT NULL,"
            "PRIMARY KEY (run_id, tick, lane_index)"
            ");";

        const bool ok = execSql(handle, create_sql, error);
        sqlite3_close(handle);
        return ok;
#else
        std::ofstream out(file_path, std::ios::app);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open fallback storage file";
            }
            return false;
        }
        return true;
#endif
    }

    bool Database::saveRun(const std::string &config_json,
                           const std::vector<ObservationRow> &rows,
                           std::string *error) const
    {
#ifdef QUEUESIM_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        if (!execSql(handle, "BEGIN TRANSACTION;", error))
        {
            sqlite3_close(handle);
            return false;
        }

        auto rollback = [&]()
        {
            if (error && error->empty())
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_exec(handle, "ROLLBACK;", nullptr, nullptr, nullptr);
            sqlite3_close(handle);
            return false;
        };

        sqlite3_stmt *run_stmt = nullptr;
        if (sqlite3_prepare_v2(handle, "INSERT INTO runs(config, ticks) VALUES(?, ?);", -1, &run_stmt, nullptr) != SQLITE_OK)
        {
            return rollback();
        }
        sqlite3_bind_text(run_stmt, 1, config_json.c_str(), static_cast<int>(config_json.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(run_stmt, 2, static_cast<sqlite3_int64>(rows.size()));
        const int run_rc = sqlite3_step(run_stmt);
        sqlite3_finalize(run_stmt);
        if (run_rc != SQLITE_DONE)
        {
            return rollback();
        }
        const sqlite3_int64 run_id = sqlite3_last_insert_rowid(handle);

        sqlite3_stmt *row_stmt = nullptr;
        const char *insert_sql =
            "INSERT INTO observations(run_id, tick, lane_index, lane_type, green, queue_length) "
            "VALUES(?, ?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(handle, insert_sql, -1, &row_stmt, nullptr) != SQLITE_OK)
        {
            return rollback();
        }

        for (const auto &row : rows)
        {
            for (std::size_t lane_index = 0; lane_index < row.lanes.size(); ++lane_index)
            {
                const LaneRecord &lane = row.lanes[lane_index];
                const std::string lane_type = laneClassToString(lane.lane_class);
                sqlite3_bind_int64(row_stmt, 1, run_id);
                sqlite3_bind_int64(row_stmt, 2, static_cast<sqlite3_int64>(row.tick));
                sqlite3_bind_int64(row_stmt, 3, static_cast<sqlite3_int64>(lane_index));
                sqlite3_bind_text(row_stmt, 4, lane_type.c_str(), static_cast<int>(lane_type.size()), SQLITE_TRANSIENT);
                sqlite3_bind_int(row_stmt, 5, lane.signal_green ? 1 : 0);
                sqlite3_bind_int(row_stmt, 6, lane.queue_length);

                const int step_rc = sqlite3_step(row_stmt);
                sqlite3_reset(row_stmt);
                if (step_rc != SQLITE_DONE)
                {
                    sqlite3_finalize(row_stmt);
                    return rollback();
                }
            }
        }
        sqlite3_finalize(row_stmt);

        if (!execSql(handle, "COMMIT;", error))
        {
            return rollback();
        }

        sqlite3_close(handle);
        return true;
#else
        std::ofstream out(file_path, std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to write fallback storage file";
            }
            return false;
        }

        // First line holds the config, then one line per tick
        std::string config_line = config_json;
        for (char &c : config_line)
        {
            if (c == '\n' || c == '\r')
                c = ' ';
        }
        out << config_line << "\n";
        for (const auto &row : rows)
        {
            out << row.tick;
            for (const auto &lane : row.lanes)
            {
                out << "," << laneClassToString(lane.lane_class) << ":" << (lane.signal_green ? 1 : 0) << ":" << lane.queue_length;
            }
            out << "\n";
        }
        return out.good();
#endif
    }

    std::optional<std::size_t> Database::loadLatestRunTickCount(std::string *error) const
    {
#ifdef QUEUESIM_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        const char *select_sql =
            "SELECT COUNT(DISTINCT tick) FROM observations "
            "WHERE run_id = (SELECT MAX(id) FROM runs);";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return std::nullopt;
        }

        std::optional<std::size_t> count;
        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
        }
        else if (error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return count;
#else
        std::ifstream in(file_path);
        if (!in.good())
        {
            return std::nullopt;
        }

        std::string line;
        std::size_t lines = 0;
        while (std::getline(in, line))
        {
            lines++;
        }
        if (lines == 0)
        {
            return std::nullopt;
        }
        return lines - 1;
#endif
    }
} // namespace queuesim::db
