#include <catch2/catch.hpp>
#include "TestSupport.hpp"
#include "workflow/Interpreter.hpp"

using namespace drflow::workflow;
using namespace drflow::test;
using namespace std::chrono_literals;

namespace {

InterpreterOptions fastOptions() {
    InterpreterOptions options;
    options.defaultTaskTimeout = 2000ms;
    options.pollInterval = 2ms;
    options.backoffScale = 0.001;
    return options;
}

std::unique_ptr<Execution> makeExecution(WorkflowDefinitionPtr def, json input = json::object(),
                                         std::chrono::milliseconds timeout = 30000ms) {
    return std::make_unique<Execution>(Execution::generateId(), std::move(def), std::move(input), timeout);
}

const char* kRetryWorkflow = R"({
    "StartAt": "Assess",
    "States": {
        "Assess": {
            "Type": "Task", "Resource": "Assess", "End": true,
            "Retry": [{"ErrorEquals": ["States.TaskFailed"], "IntervalSeconds": 3,
                       "MaxAttempts": 2, "BackoffRate": 1.5}]
        }
    }
})";

} // anonymous namespace

TEST_CASE("Sequential states pass the payload along", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Assess", [](const json& in) {
        return json{{"severity", in.at("magnitude").get<int>() * 2}};
    });
    tasks.registerTask("Notify", [](const json& in) {
        return json{{"notified", true}, {"severity", in.at("severity")}};
    });

    auto def = loadDefinition(R"({
        "StartAt": "Assess",
        "States": {
            "Assess": {"Type": "Task", "Resource": "Assess", "InputPath": "$.incident",
                       "ResultPath": "$.assessment", "Next": "Notify"},
            "Notify": {"Type": "Task", "Resource": "Notify", "InputPath": "$.assessment",
                       "ResultPath": "$.notification", "OutputPath": "$.notification", "Next": "Mark"},
            "Mark": {"Type": "Pass", "Result": "done", "ResultPath": "$.phase", "Next": "Done"},
            "Done": {"Type": "Succeed"}
        }
    })");

    auto execution = makeExecution(def, {{"incident", {{"magnitude", 3}}}});
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(execution->getPayload() == json{{"notified", true}, {"severity", 6}, {"phase", "done"}});
    REQUIRE(enteredStates(*execution) == std::vector<std::string>{"Assess", "Notify", "Mark", "Done"});
    REQUIRE(execution->getFinishedAt().has_value());

    const auto& history = execution->getHistory();
    REQUIRE(history.front().kind == EventKind::Entered);
    REQUIRE(history.front().detail["input"]["incident"]["magnitude"] == 3);
    for (size_t i = 1; i < history.size(); ++i) {
        REQUIRE(history[i - 1].timestamp <= history[i].timestamp);
    }
}

TEST_CASE("Retry waits grow by BackoffRate", "[Interpreter]") {
    TaskRegistry tasks(2);
    FlakyTask flaky{errors::TASK_FAILED, 2, {{"assessed", true}}};
    tasks.registerTask("Assess", flaky.handler());

    auto execution = makeExecution(loadDefinition(kRetryWorkflow));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(flaky.calls->load() == 3);

    auto retries = eventsOfKind(*execution, EventKind::Retried);
    REQUIRE(retries.size() == 2);
    REQUIRE(retries[0].detail["delay_ms"] == 3000);
    REQUIRE(retries[0].detail["attempt"] == 1);
    REQUIRE(retries[1].detail["delay_ms"] == 4500);
    REQUIRE(retries[1].detail["attempt"] == 2);
    REQUIRE(retries[0].detail["error"] == "States.TaskFailed");
    REQUIRE(execution->getPayload() == json{{"assessed", true}});
}

TEST_CASE("Exhausted retries propagate the original error", "[Interpreter]") {
    TaskRegistry tasks(2);
    FlakyTask flaky{errors::TASK_FAILED, 10};
    tasks.registerTask("Assess", flaky.handler());

    auto execution = makeExecution(loadDefinition(kRetryWorkflow));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
    REQUIRE(flaky.calls->load() == 3);
    REQUIRE(execution->getError().error == "States.TaskFailed");
    REQUIRE(execution->getError().cause == "attempt 3 failed");
    REQUIRE(eventsOfKind(*execution, EventKind::Retried).size() == 2);
}

TEST_CASE("Caught errors route to the fallback state", "[Interpreter]") {
    TaskRegistry tasks(2);
    FlakyTask flaky{"Custom.NoTeams", 10};
    tasks.registerTask("Notify", flaky.handler());

    auto def = loadDefinition(R"({
        "StartAt": "Notify",
        "States": {
            "Notify": {"Type": "Task", "Resource": "Notify", "Next": "Done",
                       "Retry": [{"ErrorEquals": ["States.Timeout"], "MaxAttempts": 3}],
                       "Catch": [{"ErrorEquals": ["States.ALL"], "ResultPath": "$.error", "Next": "Fallback"}]},
            "Fallback": {"Type": "Pass", "Next": "Done"},
            "Done": {"Type": "Succeed"}
        }
    })");

    auto execution = makeExecution(def, {{"incident", "flood"}});
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(flaky.calls->load() == 1);
    REQUIRE(enteredStates(*execution) == std::vector<std::string>{"Notify", "Fallback", "Done"});
    REQUIRE(execution->getPayload()["incident"] == "flood");
    REQUIRE(execution->getPayload()["error"]["error"] == "Custom.NoTeams");
    REQUIRE(execution->getPayload()["error"]["cause"] == "attempt 1 failed");

    auto caught = eventsOfKind(*execution, EventKind::Caught);
    REQUIRE(caught.size() == 1);
    REQUIRE(caught[0].detail["next"] == "Fallback");
}

TEST_CASE("Unhandled errors fail the execution with their identifier", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Assess", [](const json&) -> json {
        throw TaskInvocationError("Custom.SensorOffline", "no readings");
    });

    auto def = loadDefinition(R"({
        "StartAt": "Assess",
        "States": {
            "Assess": {"Type": "Task", "Resource": "Assess", "Next": "Done",
                       "Catch": [{"ErrorEquals": ["States.Timeout"], "Next": "Done"}]},
            "Done": {"Type": "Succeed"}
        }
    })");
    auto execution = makeExecution(def);
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
    REQUIRE(execution->getError().error == "Custom.SensorOffline");
    REQUIRE(execution->getError().cause == "no readings");
    REQUIRE(execution->getCurrentState() == "Assess");
    REQUIRE(eventsOfKind(*execution, EventKind::Exited).empty());
}

TEST_CASE("Plain exceptions from handlers become States.TaskFailed", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Assess", [](const json&) -> json {
        throw std::runtime_error("database unavailable");
    });

    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Assess",
        "States": {"Assess": {"Type": "Task", "Resource": "Assess", "End": true}}
    })"));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
    REQUIRE(execution->getError().error == "States.TaskFailed");
    REQUIRE(execution->getError().cause.find("database unavailable") != std::string::npos);
}

TEST_CASE("Unknown task refs fail with States.Runtime", "[Interpreter]") {
    TaskRegistry tasks(1);
    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Assess",
        "States": {"Assess": {"Type": "Task", "Resource": "Missing", "End": true}}
    })"));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
    REQUIRE(execution->getError().error == "States.Runtime");
}

TEST_CASE("Fail and Pass states", "[Interpreter]") {
    TaskRegistry tasks(1);
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    SECTION("Fail with explicit error") {
        auto execution = makeExecution(loadDefinition(R"({
            "StartAt": "Stop",
            "States": {"Stop": {"Type": "Fail", "Error": "Custom.Aborted", "Cause": "operator abort"}}
        })"));
        REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
        REQUIRE(execution->getError().error == "Custom.Aborted");
        REQUIRE(execution->getError().cause == "operator abort");
    }

    SECTION("Fail without error uses States.Fail") {
        auto execution = makeExecution(loadDefinition(R"({
            "StartAt": "Stop",
            "States": {"Stop": {"Type": "Fail"}}
        })"));
        REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Failed);
        REQUIRE(execution->getError().error == "States.Fail");
        REQUIRE(execution->getError().cause == "Execution reached Fail state 'Stop'");
    }

    SECTION("Pass without Result leaves the payload unchanged") {
        auto execution = makeExecution(loadDefinition(R"({
            "StartAt": "P",
            "States": {"P": {"Type": "Pass", "End": true}}
        })"), {{"k", 1}});
        REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
        REQUIRE(execution->getPayload() == json{{"k", 1}});
    }
}

TEST_CASE("Retry counters reset when a state is re-entered", "[Interpreter]") {
    TaskRegistry tasks(2);
    // Fails on calls 1 and 3, succeeds on 2 and 4
    auto calls = std::make_shared<std::atomic<int>>(0);
    tasks.registerTask("Check", [calls](const json& in) -> json {
        int n = ++(*calls);
        if (n % 2 == 1) {
            throw TaskInvocationError(errors::TASK_FAILED, "flaky");
        }
        json out = in;
        out["round"] = in.value("round", 0) + 1;
        return out;
    });
    tasks.registerTask("Loop", [](const json& in) -> json {
        if (in.at("round").get<int>() >= 2) {
            throw TaskInvocationError("Custom.Done", "two rounds");
        }
        return in;
    });

    auto def = loadDefinition(R"({
        "StartAt": "Check",
        "States": {
            "Check": {"Type": "Task", "Resource": "Check", "Next": "Loop",
                      "Retry": [{"ErrorEquals": ["States.TaskFailed"], "IntervalSeconds": 1, "MaxAttempts": 1}]},
            "Loop": {"Type": "Task", "Resource": "Loop", "Next": "Check",
                     "Catch": [{"ErrorEquals": ["Custom.Done"], "Next": "Done"}]},
            "Done": {"Type": "Succeed"}
        }
    })");

    auto execution = makeExecution(def);
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(calls->load() == 4);

    auto retries = eventsOfKind(*execution, EventKind::Retried);
    REQUIRE(retries.size() == 2);
    REQUIRE(retries[0].detail["attempt"] == 1);
    REQUIRE(retries[1].detail["attempt"] == 1);
}

TEST_CASE("Task TimeoutSeconds raises States.Timeout", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Slow", [](const json&) {
        std::this_thread::sleep_for(300ms);
        return json::object();
    });

    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Slow",
        "States": {
            "Slow": {"Type": "Task", "Resource": "Slow", "TimeoutSeconds": 0.05, "Next": "Late",
                     "Catch": [{"ErrorEquals": ["States.Timeout"], "ResultPath": "$.timeout", "Next": "Late"}]},
            "Late": {"Type": "Succeed"}
        }
    })"));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(execution->getPayload()["timeout"]["error"] == "States.Timeout");
}

TEST_CASE("Workflow deadline ends the execution as TIMED_OUT", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Slow", [](const json&) {
        std::this_thread::sleep_for(500ms);
        return json::object();
    });

    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Slow",
        "States": {
            "Slow": {"Type": "Task", "Resource": "Slow", "End": true,
                     "Catch": [{"ErrorEquals": ["States.ALL"], "Next": "Recover"}]},
            "Recover": {"Type": "Succeed"}
        }
    })"), json::object(), 50ms);
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::TimedOut);
    REQUIRE(std::chrono::steady_clock::now() - start < 400ms);
    REQUIRE(execution->getError().error == "States.Timeout");
    REQUIRE(token.reason() == StopReason::TimedOut);
    // The deadline is not catchable
    REQUIRE(eventsOfKind(*execution, EventKind::Caught).empty());
}

TEST_CASE("Deadline interrupts a backoff wait", "[Interpreter]") {
    TaskRegistry tasks(2);
    FlakyTask flaky{errors::TASK_FAILED, 10};
    tasks.registerTask("Assess", flaky.handler());

    InterpreterOptions options = fastOptions();
    options.backoffScale = 1.0;

    auto execution = makeExecution(loadDefinition(kRetryWorkflow), json::object(), 100ms);
    Interpreter interpreter(tasks, options);
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::TimedOut);
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    REQUIRE(flaky.calls->load() == 1);
}

TEST_CASE("Cancellation stops a running execution", "[Interpreter]") {
    TaskRegistry tasks(2);
    tasks.registerTask("Slow", [](const json&) {
        std::this_thread::sleep_for(300ms);
        return json::object();
    });

    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Slow",
        "States": {
            "Slow": {"Type": "Task", "Resource": "Slow", "Next": "After"},
            "After": {"Type": "Succeed"}
        }
    })"));
    Interpreter interpreter(tasks, fastOptions());
    CancellationToken token;

    std::thread canceller([token]() {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    ExecutionStatus status = interpreter.run(*execution, token);
    canceller.join();

    REQUIRE(status == ExecutionStatus::Cancelled);
    REQUIRE(execution->getError().error == "States.Cancelled");
    REQUIRE(enteredStates(*execution) == std::vector<std::string>{"Slow"});
}

TEST_CASE("Callback sees every event in order", "[Interpreter]") {
    TaskRegistry tasks(1);
    tasks.registerTask("Assess", [](const json&) { return json{{"ok", true}}; });

    auto execution = makeExecution(loadDefinition(R"({
        "StartAt": "Assess",
        "States": {"Assess": {"Type": "Task", "Resource": "Assess", "End": true}}
    })"));
    Interpreter interpreter(tasks, fastOptions());
    std::vector<EventKind> seen;
    interpreter.setCallback([&seen](const Execution&, const ExecutionEvent& evt) {
        seen.push_back(evt.kind);
    });

    CancellationToken token;
    REQUIRE(interpreter.run(*execution, token) == ExecutionStatus::Succeeded);
    REQUIRE(seen == std::vector<EventKind>{EventKind::Entered, EventKind::Exited});
    REQUIRE(execution->getHistory().size() == 2);
}
