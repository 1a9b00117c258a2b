#include <catch2/catch.hpp>
#include "workflow/DefinitionSerializer.hpp"
#include "workflow/Errors.hpp"

using namespace drflow::workflow;

namespace {

const char* kNotifyWorkflow = R"({
    "Comment": "Notify teams",
    "StartAt": "Assess",
    "TimeoutSeconds": 600,
    "States": {
        "Assess": {
            "Type": "Task",
            "Resource": "AssessEmergency",
            "TimeoutSeconds": 5,
            "ResultPath": "$.assessment",
            "Next": "Respond",
            "Retry": [{"ErrorEquals": ["States.Timeout"], "IntervalSeconds": 2, "MaxAttempts": 3,
                       "BackoffRate": 2.0, "MaxDelaySeconds": 30}],
            "Catch": [{"ErrorEquals": ["States.ALL"], "ResultPath": "$.error", "Next": "Failed"}]
        },
        "Respond": {
            "Type": "Parallel",
            "Next": "Done",
            "Branches": [
                {"StartAt": "A", "States": {"A": {"Type": "Pass", "Result": {"a": 1}, "End": true}}},
                {"StartAt": "B", "States": {"B": {"Type": "Task", "Resource": "Allocate", "End": true}}}
            ]
        },
        "Done": {"Type": "Succeed"},
        "Failed": {"Type": "Fail", "Error": "Custom.Failed", "Cause": "assessment failed"}
    }
})";

bool contains(const std::vector<std::string>& violations, const std::string& needle) {
    for (const auto& v : violations) {
        if (v.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

TEST_CASE("Parse a complete definition", "[DefinitionSerializer]") {
    auto def = DefinitionSerializer::fromString(kNotifyWorkflow, "Notify");

    REQUIRE(def->getName() == "Notify");
    REQUIRE(def->getStartAt() == "Assess");
    REQUIRE(def->getComment() == "Notify teams");
    REQUIRE(def->getTimeoutSeconds().value() == 600.0);
    REQUIRE(def->stateCount() == 4);

    const StateSpec* assess = def->getState("Assess");
    REQUIRE(assess != nullptr);
    REQUIRE(assess->type() == StateType::Task);
    REQUIRE(assess->asTask()->resource == "AssessEmergency");
    REQUIRE(assess->asTask()->timeoutSeconds.value() == 5.0);
    REQUIRE(assess->asTask()->resultPath == "$.assessment");
    REQUIRE(assess->next.value() == "Respond");

    REQUIRE(assess->retriers.size() == 1);
    const auto& retrier = assess->retriers[0];
    REQUIRE(retrier.errorEquals == std::vector<std::string>{"States.Timeout"});
    REQUIRE(retrier.intervalSeconds == 2.0);
    REQUIRE(retrier.maxAttempts == 3);
    REQUIRE(retrier.backoffRate == 2.0);
    REQUIRE(retrier.maxDelaySeconds.value() == 30.0);

    REQUIRE(assess->catchers.size() == 1);
    REQUIRE(assess->catchers[0].next == "Failed");
    REQUIRE(assess->catchers[0].resultPath == "$.error");

    const StateSpec* respond = def->getState("Respond");
    REQUIRE(respond->type() == StateType::Parallel);
    REQUIRE(respond->asParallel()->branches.size() == 2);
    REQUIRE(respond->asParallel()->branches[0]->getName() == "Notify/Respond[0]");
    REQUIRE(respond->asParallel()->branches[1]->getStartAt() == "B");

    REQUIRE(def->getState("Done")->isTerminal());
    REQUIRE(def->getState("Failed")->asFail()->error == "Custom.Failed");
}

TEST_CASE("Retrier defaults", "[DefinitionSerializer]") {
    auto def = DefinitionSerializer::fromString(R"({
        "StartAt": "T",
        "States": {"T": {"Type": "Task", "Resource": "R", "End": true,
                         "Retry": [{"ErrorEquals": ["States.ALL"]}]}}
    })", "Defaults");

    const auto& r = def->getState("T")->retriers.at(0);
    REQUIRE(r.intervalSeconds == 1.0);
    REQUIRE(r.maxAttempts == 3);
    REQUIRE(r.backoffRate == 2.0);
    REQUIRE_FALSE(r.maxDelaySeconds.has_value());

    const auto* task = def->getState("T")->asTask();
    REQUIRE(task->inputPath == "$");
    REQUIRE(task->resultPath == "$");
    REQUIRE(task->outputPath == "$");
}

TEST_CASE("Structural errors are reported together", "[DefinitionSerializer]") {
    try {
        DefinitionSerializer::fromString(R"({
            "States": {
                "Decide": {"Type": "Choice", "Next": "X"},
                "Run": {"Type": "Task", "End": true},
                "Wait": {"Type": "Pass", "End": "yes"}
            }
        })", "Broken");
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        const auto& v = e.violations();
        REQUIRE(v.size() >= 4);
        CHECK(contains(v, "missing 'StartAt'"));
        CHECK(contains(v, "unknown state Type 'Choice'"));
        CHECK(contains(v, "Task state is missing 'Resource'"));
        CHECK(contains(v, "'End' must be a boolean"));
    }
}

TEST_CASE("Invalid documents are rejected", "[DefinitionSerializer]") {
    REQUIRE_THROWS_AS(DefinitionSerializer::fromString("{not json", "Bad"), ValidationError);
    REQUIRE_THROWS_AS(DefinitionSerializer::fromString("[1, 2]", "Bad"), ValidationError);
    REQUIRE_THROWS_AS(DefinitionSerializer::fromString(R"({"StartAt": "A", "States": []})", "Bad"),
                      ValidationError);

    SECTION("Retry is only allowed on Task and Parallel") {
        try {
            DefinitionSerializer::fromString(R"({
                "StartAt": "P",
                "States": {"P": {"Type": "Pass", "End": true,
                                 "Retry": [{"ErrorEquals": ["States.ALL"]}]}}
            })", "Bad");
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            CHECK(contains(e.violations(), "only allowed on Task and Parallel"));
        }
    }
}

TEST_CASE("MaxAttempts outside the int range is rejected", "[DefinitionSerializer]") {
    auto parseAttempts = [](const std::string& attempts) {
        return DefinitionSerializer::parse(json::parse(R"({
            "StartAt": "T",
            "States": {"T": {"Type": "Task", "Resource": "T", "End": true,
                             "Retry": [{"ErrorEquals": ["States.ALL"], "MaxAttempts": )" +
                                       attempts + "}]}}}"), "Flow");
    };

    auto huge = parseAttempts("4294967295");
    REQUIRE(contains(huge.violations, "'MaxAttempts' is out of range"));

    auto negative = parseAttempts("-4294967296");
    REQUIRE(contains(negative.violations, "'MaxAttempts' is out of range"));

    auto largest = parseAttempts("2147483647");
    REQUIRE(largest.violations.empty());
    REQUIRE(largest.definition->getState("T")->retriers[0].maxAttempts == 2147483647);
}

TEST_CASE("Serialize back to JSON", "[DefinitionSerializer]") {
    auto def = DefinitionSerializer::fromString(kNotifyWorkflow, "Notify");
    json j = DefinitionSerializer::toJson(*def);

    REQUIRE(j["StartAt"] == "Assess");
    REQUIRE(j["TimeoutSeconds"] == 600.0);
    REQUIRE(j["States"]["Assess"]["Resource"] == "AssessEmergency");
    REQUIRE(j["States"]["Assess"]["Retry"][0]["MaxAttempts"] == 3);
    REQUIRE(j["States"]["Respond"]["Branches"].size() == 2);
    REQUIRE(j["States"]["Failed"]["Error"] == "Custom.Failed");

    auto reparsed = DefinitionSerializer::fromJson(j, "Notify");
    REQUIRE(DefinitionSerializer::toJson(*reparsed) == j);
}
