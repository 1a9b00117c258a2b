#include <catch2/catch.hpp>
#include "workflow/SituationReport.hpp"

using namespace drflow::workflow;
using namespace drflow::storage;

namespace {

EventRecord event(int64_t seq, const std::string& state, const std::string& kind,
                  const std::string& detail) {
    return EventRecord{
        .sequence = seq,
        .timestamp = "2026-03-01T10:00:0" + std::to_string(seq) + ".000Z",
        .stateName = state,
        .kind = kind,
        .detailJson = detail
    };
}

ExecutionRecord baseRecord() {
    ExecutionRecord record;
    record.id = "exec_00000000000000ab";
    record.workflowName = "NaturalDisasterResponseWorkflow";
    record.status = "SUCCEEDED";
    record.currentState = "GenerateSituationReport";
    record.startedAt = "2026-03-01T10:00:00.000Z";
    record.finishedAt = "2026-03-01T10:00:02.500Z";
    record.history = {
        event(0, "AssessEmergency", "ENTERED", R"({"input":{}})"),
        event(1, "AssessEmergency", "RETRIED",
              R"({"error":"States.Timeout","cause":"slow sensor","attempt":1,"delay_ms":2000,"retrier":0})"),
        event(2, "NotifyEmergencyTeams", "CAUGHT",
              R"({"error":"States.TaskFailed","cause":"pager down","next":"NotificationFallback"})"),
        event(3, "ParallelResponse", "BRANCHED", R"({"branch_count":3})"),
        event(4, "ParallelResponse", "JOINED",
              R"({"succeeded":false,"branches":[{"index":0,"status":"SUCCEEDED"},)"
              R"({"index":1,"status":"FAILED","error":"Custom.NoVehicles"}]})")
    };
    return record;
}

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("Report header and counters", "[SituationReport]") {
    std::string report = SituationReport::render(baseRecord());

    REQUIRE(report.rfind("SITUATION REPORT: NaturalDisasterResponseWorkflow\n", 0) == 0);
    CHECK(has(report, "Execution: exec_00000000000000ab"));
    CHECK(has(report, "Status:    SUCCEEDED"));
    CHECK(has(report, "Finished:  2026-03-01T10:00:02.500Z (2.500 s)"));
    CHECK(has(report, "Retries:   1, caught errors: 1"));
    CHECK(has(report, "Outcome: completed successfully"));
}

TEST_CASE("Timeline describes each event", "[SituationReport]") {
    std::string report = SituationReport::render(baseRecord());

    CHECK(has(report, "AssessEmergency: States.Timeout, retry 1 after 2000 ms (slow sensor)"));
    CHECK(has(report, "NotifyEmergencyTeams: States.TaskFailed handled, continuing at NotificationFallback"));
    CHECK(has(report, "ParallelResponse: 3 branches started"));
    CHECK(has(report, "[0] SUCCEEDED [1] FAILED (Custom.NoVehicles)"));

    // Events keep their order
    REQUIRE(report.find("RETRIED") < report.find("CAUGHT"));
    REQUIRE(report.find("BRANCHED") < report.find("JOINED"));
}

TEST_CASE("Running and failed executions", "[SituationReport]") {
    ExecutionRecord record = baseRecord();

    SECTION("running shows the current state") {
        record.status = "RUNNING";
        record.finishedAt = "";
        std::string report = SituationReport::render(record);
        CHECK(has(report, "Current:   GenerateSituationReport"));
        CHECK(has(report, "Outcome: in progress"));
        CHECK_FALSE(has(report, "Finished:"));
    }

    SECTION("failure shows error and cause") {
        record.status = "TIMED_OUT";
        record.error = "States.Timeout";
        record.cause = "Execution exec_00000000000000ab exceeded its deadline of 1800000 ms";
        std::string report = SituationReport::render(record);
        CHECK(has(report, "Outcome: TIMED_OUT - States.Timeout: Execution exec_00000000000000ab exceeded"));
    }

    SECTION("empty history") {
        record.history.clear();
        std::string report = SituationReport::render(record);
        CHECK(has(report, "(no events recorded)"));
        CHECK(has(report, "Retries:   0, caught errors: 0"));
    }

    SECTION("malformed detail does not break the report") {
        record.history.push_back(event(5, "GenerateSituationReport", "RETRIED", "not json"));
        std::string report = SituationReport::render(record);
        CHECK(has(report, "GenerateSituationReport: , retry 0 after 0 ms"));
    }
}
