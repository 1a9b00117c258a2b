#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <cstdint>

namespace drflow {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized, thread-safe log output
 *
 * Lines look like:
 *   [2026-10-18 09:12:03.481] [INFO ] [exec_1a2b/Respond[0]] Task 'Allocate' ...
 * The bracketed correlation tag is the innermost LogScope of the calling
 * thread; lines logged outside any scope carry no tag.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    /**
     * One HTTP exchange, from request line to response status
     */
    struct RequestTrace {
        uint64_t id = 0;
        std::chrono::steady_clock::time_point start;
    };

    RequestTrace beginRequest(const std::string& method, const std::string& target,
                              const std::string& body = "");
    void endRequest(const RequestTrace& trace, int statusCode, const std::string& body);

    // Helpers
    static std::string levelToString(LogLevel level);
    static LogLevel levelFromString(const std::string& level);

    /// Correlation tag of the calling thread ("" outside any LogScope)
    static std::string currentScope();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    std::atomic<uint64_t> m_requestCounter{0};
};

/**
 * Tags every line the current thread logs while the scope is alive.
 *
 *   LogScope scope(execution.getId());   // "[exec_1a2b]"
 *   LogScope branch("Respond[0]");       // "[exec_1a2b/Respond[0]]"
 *
 * A nested scope extends the enclosing tag; pass nest=false to replace it
 * (used when work is handed to another thread with a captured tag).
 */
class LogScope {
public:
    explicit LogScope(const std::string& tag, bool nest = true);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_previous;
};

// Convenience macros
#define LOG_DEBUG(msg) drflow::Logger::instance().debug(msg)
#define LOG_INFO(msg) drflow::Logger::instance().info(msg)
#define LOG_WARN(msg) drflow::Logger::instance().warn(msg)
#define LOG_ERROR(msg) drflow::Logger::instance().error(msg)

} // namespace drflow
