#pragma once

#include "core/Logger.hpp"
#include "workflow/ExecutionService.hpp"
#include <chrono>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>

namespace drflow {
namespace server {

/**
 * Bad command-line flag or configuration value
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Process configuration, from flags and an optional key=value file
 *
 * Keys (file) / flags:
 *   address                    -a, --address ADDR
 *   port                       -p, --port PORT
 *   log_level                  -l, --log-level LVL
 *   log_file                   --log-file PATH
 *   database                   -d, --database PATH
 *   workflows_dir              -w, --workflows DIR
 *   task_threads               --task-threads N
 *   workflow_timeout_seconds   --workflow-timeout SECONDS
 *   task_timeout_seconds       --task-timeout SECONDS
 *   poll_interval_ms           --poll-interval MS
 *   task.<Ref>=<url>           --task Ref=URL
 */
struct AppConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::string database = "drflow.db";
    std::string workflowsDir;
    size_t taskThreads = 4;
    double workflowTimeoutSeconds = 1800;
    double taskTimeoutSeconds = 60;
    long pollIntervalMs = 10;
    std::map<std::string, std::string> taskEndpoints;  // TaskRef -> http URL
    bool showHelp = false;

    /**
     * Engine options derived from this configuration
     */
    workflow::ServiceOptions serviceOptions() const;
    std::chrono::milliseconds taskTimeout() const;
};

/**
 * Parse command-line arguments; `--config FILE` (or `@FILE`) loads a file
 * whose values are overridden by flags that follow it.
 * Throws ConfigError.
 */
AppConfig parseArgs(int argc, char* argv[]);

/**
 * Apply every key=value line of a file ('#' comments, blank lines ignored)
 */
void loadConfigFile(const std::string& path, AppConfig& config);

/**
 * Read key=value lines, trimming whitespace around keys and values
 */
std::map<std::string, std::string> parseKeyValueLines(std::istream& in);

/**
 * Set one configuration key, throws ConfigError on unknown key or bad value
 */
void applyConfigValue(AppConfig& config, const std::string& key, const std::string& value);

std::string usage(const std::string& program);

} // namespace server
} // namespace drflow
