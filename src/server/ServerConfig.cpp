#include "server/ServerConfig.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace opgraph {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

unsigned long parseUnsigned(const std::string& key, const std::string& value,
                            unsigned long min, unsigned long max) {
    size_t consumed = 0;
    unsigned long result = 0;
    try {
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        result = std::stoul(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (consumed != value.size() || result < min || result > max) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "' (expected " +
                                    std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return result;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
}

// Flags that take a value, mapped to their file key
const std::map<std::string, std::string>& valueFlags() {
    static const std::map<std::string, std::string> flags = {
        {"-a", "address"}, {"--address", "address"},
        {"-p", "port"}, {"--port", "port"},
        {"-l", "log_level"}, {"--log-level", "log_level"},
        {"--log-file", "log_file"},
        {"-d", "dataset"}, {"--dataset", "dataset"},
        {"-g", "graphs_db"}, {"--graphs-db", "graphs_db"},
        {"-w", "workers"}, {"--workers", "workers"},
        {"-r", "retries"}, {"--retries", "retries"},
    };
    return flags;
}

} // anonymous namespace

void ServerConfig::set(const std::string& key, const std::string& value) {
    if (key == "address") {
        if (value.empty()) throw std::invalid_argument("address must not be empty");
        address = value;
    } else if (key == "port") {
        port = static_cast<unsigned short>(parseUnsigned(key, value, 1, 65535));
    } else if (key == "log_level") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            throw std::invalid_argument("Invalid log level: '" + value + "' (debug, info, warn, error)");
        }
        logLevel = *level;
    } else if (key == "log_file") {
        logFile = value;
    } else if (key == "dataset") {
        datasetPath = value;
    } else if (key == "graphs_db") {
        graphsDbPath = value;
    } else if (key == "workers") {
        workers = parseUnsigned(key, value, 1, 1024);
    } else if (key == "retries") {
        retries = static_cast<int>(parseUnsigned(key, value, 1, 1000));
    } else if (key == "profiler") {
        enableProfiler = parseBool(key, value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

std::map<std::string, std::string> ServerConfig::readKeyValueFile(const std::string& path) {
    std::string filePath = (!path.empty() && path[0] == '@') ? path.substr(1) : path;

    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Malformed config line (expected key=value): " + line);
        }
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return values;
}

ServerConfig ServerConfig::fromArgs(int argc, const char* const argv[]) {
    ServerConfig config;
    std::map<std::string, std::string> cliValues;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "--no-profiler") {
            cliValues["profiler"] = "false";
        } else if (arg == "--config") {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for --config");
            config.configFile = argv[++i];
        } else if (auto it = valueFlags().find(arg); it != valueFlags().end()) {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            cliValues[it->second] = argv[++i];
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (!config.configFile.empty()) {
        for (const auto& [key, value] : readKeyValueFile(config.configFile)) {
            if (!cliValues.count(key)) {
                config.set(key, value);
            }
        }
    }

    for (const auto& [key, value] : cliValues) {
        config.set(key, value);
    }

    return config;
}

std::string ServerConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -p, --port PORT       Port to listen on (default: 8080)\n"
        << "  -a, --address ADDR    Address to bind to (default: 0.0.0.0)\n"
        << "  -d, --dataset PATH    CSV dataset the operations read\n"
        << "  -g, --graphs-db PATH  Graphs SQLite database (default: graphs.db)\n"
        << "  -w, --workers N       Worker threads per execution (default: 4)\n"
        << "  -r, --retries N       Attempts per node before aborting (default: 3)\n"
        << "  -l, --log-level LVL   Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH       Also write logs to PATH\n"
        << "  --config FILE         Settings file (key=value lines, @file syntax)\n"
        << "  --no-profiler         Disable profiler\n"
        << "  -h, --help            Show this help\n";
    return oss.str();
}

} // namespace server
} // namespace opgraph
