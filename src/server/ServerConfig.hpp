#pragma once

#include "server/Logger.hpp"
#include <cstddef>
#include <map>
#include <string>

namespace opgraph {
namespace server {

/**
 * Server settings from the command line and an optional key=value file
 *
 * Command-line flags win over file values. File keys use the long flag
 * names with underscores (port, address, workers, retries, log_level,
 * log_file, dataset, graphs_db, profiler). Lines starting with '#'
 * are comments.
 */
struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::string datasetPath;
    std::string graphsDbPath = "graphs.db";
    size_t workers = 4;
    int retries = 3;
    bool enableProfiler = true;
    bool showHelp = false;
    std::string configFile;

    /**
     * Parse argv (argv[0] is skipped)
     * Throws std::invalid_argument on unknown flags, missing or invalid values
     */
    static ServerConfig fromArgs(int argc, const char* const argv[]);

    /**
     * Read key=value lines; a leading '@' on the path is accepted
     * Throws std::runtime_error if the file cannot be opened
     */
    static std::map<std::string, std::string> readKeyValueFile(const std::string& path);

    /**
     * Apply one setting by file key name
     * Throws std::invalid_argument for unknown keys and bad values
     */
    void set(const std::string& key, const std::string& value);

    static std::string usage(const std::string& program);
};

} // namespace server
} // namespace opgraph
