#include <catch2/catch.hpp>
#include "TestSupport.hpp"
#include "workflow/ExecutionService.hpp"
#include "workflow/TimeUtil.hpp"

using namespace drflow::workflow;
using namespace drflow::storage;
using namespace drflow::test;
using namespace std::chrono_literals;

namespace {

ServiceOptions fastServiceOptions() {
    ServiceOptions options;
    options.defaultWorkflowTimeout = 10000ms;
    options.interpreter.defaultTaskTimeout = 2000ms;
    options.interpreter.pollInterval = 2ms;
    options.interpreter.backoffScale = 0.001;
    return options;
}

const char* kDispatchWorkflow = R"({
    "StartAt": "Assess",
    "States": {
        "Assess": {"Type": "Task", "Resource": "Assess", "ResultPath": "$.assessment", "Next": "Notify",
                   "Retry": [{"ErrorEquals": ["States.TaskFailed"], "IntervalSeconds": 2, "MaxAttempts": 2}]},
        "Notify": {"Type": "Task", "Resource": "Notify", "ResultPath": "$.notification", "End": true}
    }
})";

struct ServiceFixture {
    TempDatabase tempDb;
    ExecutionStore store{tempDb.path()};
    TaskRegistry tasks{4};
    WorkflowRegistry workflows;

    ServiceFixture() {
        workflows.registerWorkflow("Dispatch", json::parse(kDispatchWorkflow));
        tasks.registerTask("Notify", [](const json&) { return json{{"sent", 3}}; });
    }
};

} // anonymous namespace

TEST_CASE("Executions run in the background and are persisted", "[ExecutionService]") {
    ServiceFixture f;
    FlakyTask flaky{errors::TASK_FAILED, 1, {{"severity", 4}}};
    f.tasks.registerTask("Assess", flaky.handler());

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::string id = service.start("Dispatch", {{"incident", "flood"}});
    REQUIRE(id.rfind("exec_", 0) == 0);

    // The record exists as soon as start() returns
    REQUIRE(f.store.getExecution(id).has_value());

    auto record = service.waitForCompletion(id, 5s);
    REQUIRE(record.has_value());
    REQUIRE(record->status == "SUCCEEDED");
    REQUIRE(record->workflowName == "Dispatch");
    REQUIRE_FALSE(record->finishedAt.empty());
    REQUIRE(record->timeoutMs == 10000);

    json payload = json::parse(record->payloadJson);
    REQUIRE(payload["incident"] == "flood");
    REQUIRE(payload["assessment"]["severity"] == 4);
    REQUIRE(payload["notification"]["sent"] == 3);

    std::vector<std::string> kinds;
    for (const auto& evt : record->history) kinds.push_back(evt.kind);
    REQUIRE(kinds == std::vector<std::string>{
        "ENTERED", "RETRIED", "EXITED", "ENTERED", "EXITED"});
    REQUIRE(json::parse(record->history[1].detailJson)["delay_ms"] == 2000);

    REQUIRE(service.activeCount() == 0);
}

TEST_CASE("Definition TimeoutSeconds overrides the default deadline", "[ExecutionService]") {
    ServiceFixture f;
    json doc = json::parse(kDispatchWorkflow);
    doc["TimeoutSeconds"] = 0.05;
    f.workflows.registerWorkflow("Short", doc);
    f.tasks.registerTask("Assess", [](const json&) {
        std::this_thread::sleep_for(300ms);
        return json::object();
    });

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::string id = service.start("Short", json::object());

    auto record = service.waitForCompletion(id, 5s);
    REQUIRE(record->status == "TIMED_OUT");
    REQUIRE(record->error == "States.Timeout");
    REQUIRE(record->timeoutMs == 50);
}

TEST_CASE("Starting an unknown workflow is rejected", "[ExecutionService]") {
    ServiceFixture f;
    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());

    REQUIRE_THROWS_AS(service.start("Missing", json::object()), std::invalid_argument);
    REQUIRE(f.store.listExecutions().empty());
}

TEST_CASE("Cancel stops a running execution", "[ExecutionService]") {
    ServiceFixture f;
    f.tasks.registerTask("Assess", [](const json&) {
        std::this_thread::sleep_for(300ms);
        return json::object();
    });

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::string id = service.start("Dispatch", json::object());

    std::this_thread::sleep_for(20ms);
    REQUIRE(service.cancel(id));

    auto record = service.waitForCompletion(id, 5s);
    REQUIRE(record->status == "CANCELLED");
    REQUIRE(record->error == "States.Cancelled");

    // Nothing left to cancel
    REQUIRE_FALSE(service.cancel(id));
    REQUIRE_FALSE(service.cancel("exec_unknown"));
}

TEST_CASE("Interrupted executions resume from their last entered state", "[ExecutionService]") {
    ServiceFixture f;
    auto assessCalls = std::make_shared<std::atomic<int>>(0);
    f.tasks.registerTask("Assess", [assessCalls](const json&) {
        ++(*assessCalls);
        return json{{"severity", 1}};
    });

    // State left behind by a process that died inside Notify
    f.store.createExecution(ExecutionRecord{
        .id = "exec_interrupted",
        .workflowName = "Dispatch",
        .status = "RUNNING",
        .currentState = "Notify",
        .inputJson = R"({"incident":"quake"})",
        .payloadJson = R"({"incident":"quake"})",
        .error = "",
        .cause = "",
        .timeoutMs = 60000,
        .startedAt = formatTimestamp(std::chrono::system_clock::now()),
        .updatedAt = "",
        .finishedAt = "",
        .history = {}
    });
    auto event = [](const std::string& state, const std::string& kind, const json& detail) {
        return EventRecord{.sequence = 0, .timestamp = "", .stateName = state, .kind = kind,
                           .detailJson = detail.dump()};
    };
    f.store.appendEvent("exec_interrupted", event("Assess", "ENTERED", {{"input", {{"incident", "quake"}}}}));
    f.store.appendEvent("exec_interrupted", event("Assess", "EXITED", {{"output", {{"incident", "quake"}}}}));
    f.store.appendEvent("exec_interrupted", event("Notify", "ENTERED",
        {{"input", {{"incident", "quake"}, {"assessment", {{"severity", 5}}}}}}));

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    REQUIRE(service.recoverInterrupted() == 1);

    auto record = service.waitForCompletion("exec_interrupted", 5s);
    REQUIRE(record->status == "SUCCEEDED");
    REQUIRE(assessCalls->load() == 0);

    json payload = json::parse(record->payloadJson);
    REQUIRE(payload["assessment"]["severity"] == 5);
    REQUIRE(payload["notification"]["sent"] == 3);

    // Prior history is kept, Notify is entered a second time
    REQUIRE(record->history.size() == 5);
    REQUIRE(record->history[3].stateName == "Notify");
    REQUIRE(record->history[3].kind == "ENTERED");
    REQUIRE(record->history[4].kind == "EXITED");
}

TEST_CASE("Recovery fails executions of unregistered workflows", "[ExecutionService]") {
    ServiceFixture f;
    f.store.createExecution(ExecutionRecord{
        .id = "exec_orphan",
        .workflowName = "Retired",
        .status = "RUNNING",
        .currentState = "",
        .inputJson = "{}",
        .payloadJson = "{}",
        .error = "",
        .cause = "",
        .timeoutMs = 60000,
        .startedAt = "",
        .updatedAt = "",
        .finishedAt = "",
        .history = {}
    });

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    REQUIRE(service.recoverInterrupted() == 0);

    auto record = f.store.getExecution("exec_orphan");
    REQUIRE(record->status == "FAILED");
    REQUIRE(record->error == "States.Runtime");
    REQUIRE_FALSE(record->finishedAt.empty());
}

TEST_CASE("Shutdown cancels running executions", "[ExecutionService]") {
    ServiceFixture f;
    f.tasks.registerTask("Assess", [](const json&) {
        std::this_thread::sleep_for(200ms);
        return json::object();
    });

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::string id = service.start("Dispatch", json::object());
    std::this_thread::sleep_for(20ms);

    service.shutdown();
    service.shutdown();

    REQUIRE(f.store.getExecution(id)->status == "CANCELLED");
    REQUIRE_THROWS_AS(service.start("Dispatch", json::object()), std::runtime_error);
}

TEST_CASE("Concurrent executions are independent", "[ExecutionService]") {
    ServiceFixture f;
    f.tasks.registerTask("Assess", [](const json& in) {
        std::this_thread::sleep_for(20ms);
        return json{{"id", in.at("n")}};
    });

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::vector<std::string> ids;
    for (int n = 0; n < 5; ++n) {
        ids.push_back(service.start("Dispatch", {{"n", n}}));
    }

    for (int n = 0; n < 5; ++n) {
        auto record = service.waitForCompletion(ids[n], 5s);
        REQUIRE(record->status == "SUCCEEDED");
        REQUIRE(json::parse(record->payloadJson)["assessment"]["id"] == n);
    }
    REQUIRE(service.listExecutions("Dispatch").size() == 5);
}

TEST_CASE("Long executions do not delay new ones", "[ExecutionService]") {
    ServiceFixture f;
    f.tasks.registerTask("Assess", [](const json&) {
        std::this_thread::sleep_for(400ms);
        return json::object();
    });
    f.workflows.registerWorkflow("Quick", json::parse(R"({
        "StartAt": "Log",
        "TimeoutSeconds": 0.2,
        "States": {"Log": {"Type": "Pass", "Result": {"logged": true}, "End": true}}
    })"));

    ExecutionService service(f.workflows, f.tasks, f.store, fastServiceOptions());
    std::vector<std::string> slow;
    for (int n = 0; n < 8; ++n) {
        slow.push_back(service.start("Dispatch", {{"n", n}}));
    }
    std::string quick = service.start("Quick", json::object());

    auto record = service.waitForCompletion(quick, 150ms);
    REQUIRE(record->status == "SUCCEEDED");
    REQUIRE(json::parse(record->payloadJson)["logged"] == true);

    for (const auto& id : slow) {
        REQUIRE(service.waitForCompletion(id, 5s)->status == "SUCCEEDED");
    }
}
