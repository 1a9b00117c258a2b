#include "server/Config.hpp"
#include <cmath>
#include <fstream>
#include <sstream>

namespace drflow {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

long parseInteger(const std::string& key, const std::string& value, long min, long max) {
    size_t pos = 0;
    long result = 0;
    try {
        result = std::stol(value, &pos);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || result < min || result > max) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "' (expected " +
                          std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return result;
}

double parsePositive(const std::string& key, const std::string& value) {
    size_t pos = 0;
    double result = 0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || !(result > 0) || !std::isfinite(result)) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "' (expected a positive number)");
    }
    return result;
}

} // anonymous namespace

workflow::ServiceOptions AppConfig::serviceOptions() const {
    workflow::ServiceOptions options;
    options.defaultWorkflowTimeout = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(workflowTimeoutSeconds * 1000.0)));
    options.interpreter.defaultTaskTimeout = taskTimeout();
    options.interpreter.pollInterval = std::chrono::milliseconds(pollIntervalMs);
    return options;
}

std::chrono::milliseconds AppConfig::taskTimeout() const {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(taskTimeoutSeconds * 1000.0)));
}

std::map<std::string, std::string> parseKeyValueLines(std::istream& in) {
    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (!key.empty()) values[key] = val;
    }
    return values;
}

void loadConfigFile(const std::string& path, AppConfig& config) {
    std::string file = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("Cannot open config file: " + file);
    }
    for (const auto& [key, value] : parseKeyValueLines(in)) {
        applyConfigValue(config, key, value);
    }
}

void applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
    if (key == "address") {
        config.address = value;
    } else if (key == "port") {
        config.port = static_cast<unsigned short>(parseInteger(key, value, 1, 65535));
    } else if (key == "log_level") {
        try {
            config.logLevel = Logger::levelFromString(value);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    } else if (key == "log_file") {
        config.logFile = value;
    } else if (key == "database") {
        config.database = value;
    } else if (key == "workflows_dir") {
        config.workflowsDir = value;
    } else if (key == "task_threads") {
        config.taskThreads = static_cast<size_t>(parseInteger(key, value, 1, 1024));
    } else if (key == "workflow_timeout_seconds") {
        config.workflowTimeoutSeconds = parsePositive(key, value);
    } else if (key == "task_timeout_seconds") {
        config.taskTimeoutSeconds = parsePositive(key, value);
    } else if (key == "poll_interval_ms") {
        config.pollIntervalMs = parseInteger(key, value, 1, 60000);
    } else if (key.rfind("task.", 0) == 0 && key.size() > 5) {
        if (value.empty()) {
            throw ConfigError("Empty endpoint for " + key);
        }
        config.taskEndpoints[key.substr(5)] = value;
    } else {
        throw ConfigError("Unknown configuration key: " + key);
    }
}

AppConfig parseArgs(int argc, char* argv[]) {
    AppConfig config;

    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--port") {
            applyConfigValue(config, "port", next(i, arg));
        } else if (arg == "-a" || arg == "--address") {
            applyConfigValue(config, "address", next(i, arg));
        } else if (arg == "-l" || arg == "--log-level") {
            applyConfigValue(config, "log_level", next(i, arg));
        } else if (arg == "--log-file") {
            applyConfigValue(config, "log_file", next(i, arg));
        } else if (arg == "-d" || arg == "--database") {
            applyConfigValue(config, "database", next(i, arg));
        } else if (arg == "-w" || arg == "--workflows") {
            applyConfigValue(config, "workflows_dir", next(i, arg));
        } else if (arg == "--task-threads") {
            applyConfigValue(config, "task_threads", next(i, arg));
        } else if (arg == "--workflow-timeout") {
            applyConfigValue(config, "workflow_timeout_seconds", next(i, arg));
        } else if (arg == "--task-timeout") {
            applyConfigValue(config, "task_timeout_seconds", next(i, arg));
        } else if (arg == "--poll-interval") {
            applyConfigValue(config, "poll_interval_ms", next(i, arg));
        } else if (arg == "--task") {
            std::string mapping = next(i, arg);
            auto eq = mapping.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw ConfigError("Expected --task Ref=URL, got '" + mapping + "'");
            }
            applyConfigValue(config, "task." + mapping.substr(0, eq), mapping.substr(eq + 1));
        } else if (arg == "--config") {
            loadConfigFile(next(i, arg), config);
        } else if (!arg.empty() && arg[0] == '@') {
            loadConfigFile(arg, config);
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -p, --port PORT            Port to listen on (default: 8080)\n"
        << "  -a, --address ADDR         Address to bind to (default: 0.0.0.0)\n"
        << "  -d, --database PATH        SQLite execution store (default: drflow.db)\n"
        << "  -w, --workflows DIR        Directory of workflow definitions (*.json)\n"
        << "  -l, --log-level LVL        Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH            Write logs to PATH instead of stdout\n"
        << "  --task-threads N           Concurrent task handlers (default: 4)\n"
        << "  --workflow-timeout SEC     Default workflow deadline (default: 1800)\n"
        << "  --task-timeout SEC         Default task invocation timeout (default: 60)\n"
        << "  --poll-interval MS         Cancellation/deadline polling (default: 10)\n"
        << "  --task REF=URL             Invoke task REF by POSTing to URL\n"
        << "  --config FILE, @FILE       Read key=value settings from FILE\n"
        << "  -h, --help                 Show this help\n";
    return oss.str();
}

} // namespace server
} // namespace drflow
