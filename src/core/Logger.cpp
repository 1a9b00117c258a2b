#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drflow {

namespace {

thread_local std::string t_scope;

constexpr size_t kMaxBodyLog = 500;

std::string clip(const std::string& body) {
    if (body.size() <= kMaxBodyLog) {
        return body;
    }
    return body.substr(0, kMaxBodyLog) + "... (" + std::to_string(body.size()) + " bytes)";
}

std::string wallClock() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// Logger
// =============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
}

void Logger::setOutputStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_output = os ? os : &std::cout;
}

void Logger::enableFileLogging(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_fileStream.open(filepath, std::ios::app);
    if (!m_fileStream.is_open()) {
        throw std::runtime_error("Cannot open log file: " + filepath);
    }
    m_output = &m_fileStream;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

LogLevel Logger::levelFromString(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level);
}

std::string Logger::currentScope() {
    return t_scope;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < m_level.load()) return;

    std::string line = "[" + wallClock() + "] [" + levelToString(level) + "] ";
    if (!t_scope.empty()) {
        line += "[" + t_scope + "] ";
    }
    line += message;

    std::lock_guard<std::mutex> lock(m_mutex);
    *m_output << line << std::endl;
}

Logger::RequestTrace Logger::beginRequest(const std::string& method, const std::string& target,
                                          const std::string& body) {
    RequestTrace trace{++m_requestCounter, std::chrono::steady_clock::now()};

    std::string line = "http-" + std::to_string(trace.id) + " " + method + " " + target;
    if (!body.empty()) {
        line += " | " + clip(body);
    }
    info(line);
    return trace;
}

void Logger::endRequest(const RequestTrace& trace, int statusCode, const std::string& body) {
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - trace.start).count();

    std::ostringstream oss;
    oss << "http-" << trace.id << " -> " << statusCode << " (" << body.size() << " bytes, "
        << std::fixed << std::setprecision(1) << elapsed << " ms)";
    if (!body.empty() && m_level.load() <= LogLevel::DEBUG) {
        oss << " | " << clip(body);
    }
    log(statusCode >= 500 ? LogLevel::ERROR : LogLevel::INFO, oss.str());
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const std::string& tag, bool nest)
    : m_previous(t_scope)
{
    t_scope = (nest && !t_scope.empty()) ? t_scope + "/" + tag : tag;
}

LogScope::~LogScope() {
    t_scope = std::move(m_previous);
}

} // namespace drflow
