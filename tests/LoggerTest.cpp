#include <catch2/catch.hpp>
#include "core/Logger.hpp"
#include <sstream>
#include <thread>

using namespace drflow;

namespace {

// Redirects the singleton for the duration of a test
struct CapturedLog {
    std::ostringstream out;
    LogLevel previousLevel;

    explicit CapturedLog(LogLevel level) : previousLevel(Logger::instance().getLevel()) {
        Logger::instance().setOutputStream(&out);
        Logger::instance().setLevel(level);
    }
    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(previousLevel);
    }

    bool contains(const std::string& needle) const {
        return out.str().find(needle) != std::string::npos;
    }
};

} // anonymous namespace

TEST_CASE("Level names", "[Logger]") {
    REQUIRE(Logger::levelFromString("DEBUG") == LogLevel::DEBUG);
    REQUIRE(Logger::levelFromString("warning") == LogLevel::WARN);
    REQUIRE(Logger::levelFromString("Error") == LogLevel::ERROR);
    REQUIRE_THROWS_AS(Logger::levelFromString("verbose"), std::invalid_argument);
    REQUIRE(Logger::levelToString(LogLevel::INFO) == "INFO ");
}

TEST_CASE("Lines below the level are dropped", "[Logger]") {
    CapturedLog log(LogLevel::WARN);
    LOG_INFO("routine");
    LOG_WARN("degraded");

    REQUIRE_FALSE(log.contains("routine"));
    REQUIRE(log.contains("[WARN ] degraded"));
}

TEST_CASE("Scopes tag lines with the execution and branch", "[Logger]") {
    CapturedLog log(LogLevel::DEBUG);
    LOG_INFO("before");
    {
        LogScope execution("exec_42");
        LOG_INFO("in execution");
        {
            LogScope branch("Respond[1]");
            REQUIRE(Logger::currentScope() == "exec_42/Respond[1]");
            LOG_DEBUG("in branch");
        }
        LOG_INFO("back in execution");
    }
    LOG_INFO("after");

    REQUIRE(log.contains("[INFO ] before"));
    REQUIRE(log.contains("[exec_42] in execution"));
    REQUIRE(log.contains("[exec_42/Respond[1]] in branch"));
    REQUIRE(log.contains("[exec_42] back in execution"));
    REQUIRE(log.contains("[INFO ] after"));
    REQUIRE(Logger::currentScope().empty());
}

TEST_CASE("Scopes are per thread", "[Logger]") {
    CapturedLog log(LogLevel::INFO);
    LogScope outer("exec_main");

    std::string inheritedScope = "unset";
    std::thread worker([&inheritedScope]() {
        inheritedScope = Logger::currentScope();
        LogScope handed("exec_main/Notify", false);
        LOG_INFO("from worker");
    });
    worker.join();

    REQUIRE(inheritedScope.empty());
    REQUIRE(Logger::currentScope() == "exec_main");
    REQUIRE(log.contains("[exec_main/Notify] from worker"));
}

TEST_CASE("HTTP exchanges share a trace id", "[Logger]") {
    CapturedLog log(LogLevel::INFO);
    auto trace = Logger::instance().beginRequest("GET", "/api/health");
    Logger::instance().endRequest(trace, 200, R"({"status":"ok"})");

    std::string id = "http-" + std::to_string(trace.id);
    REQUIRE(log.contains(id + " GET /api/health"));
    REQUIRE(log.contains(id + " -> 200 (15 bytes"));
}
