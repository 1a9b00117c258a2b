#include "workflow/SituationReport.hpp"
#include "workflow/TimeUtil.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

namespace {

std::string formatDuration(const std::string& from, const std::string& to) {
    try {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            parseTimestamp(to) - parseTimestamp(from)).count();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << ms / 1000.0 << " s";
        return oss.str();
    } catch (const std::invalid_argument&) {
        return "unknown";
    }
}

} // anonymous namespace

std::string SituationReport::render(const storage::ExecutionRecord& record) {
    std::ostringstream out;

    size_t retries = 0;
    size_t catches = 0;
    for (const auto& evt : record.history) {
        if (evt.kind == "RETRIED") ++retries;
        if (evt.kind == "CAUGHT") ++catches;
    }

    out << "SITUATION REPORT: " << record.workflowName << "\n";
    out << "Execution: " << record.id << "\n";
    out << "Status:    " << record.status << "\n";
    out << "Started:   " << record.startedAt << "\n";
    if (!record.finishedAt.empty()) {
        out << "Finished:  " << record.finishedAt
            << " (" << formatDuration(record.startedAt, record.finishedAt) << ")\n";
    } else {
        out << "Current:   " << record.currentState << "\n";
    }
    out << "Retries:   " << retries << ", caught errors: " << catches << "\n";

    out << "\nTimeline:\n";
    if (record.history.empty()) {
        out << "  (no events recorded)\n";
    }
    for (const auto& evt : record.history) {
        out << "  " << evt.timestamp << "  " << std::left << std::setw(9) << evt.kind
            << describeEvent(evt) << "\n";
    }

    out << "\nOutcome: ";
    if (record.status == "SUCCEEDED") {
        out << "completed successfully\n";
    } else if (record.status == "RUNNING") {
        out << "in progress\n";
    } else {
        out << record.status;
        if (!record.error.empty()) {
            out << " - " << record.error;
            if (!record.cause.empty()) out << ": " << record.cause;
        }
        out << "\n";
    }
    return out.str();
}

std::string SituationReport::describeEvent(const storage::EventRecord& event) {
    json detail = json::parse(event.detailJson.empty() ? "{}" : event.detailJson, nullptr, false);
    if (detail.is_discarded() || !detail.is_object()) {
        detail = json::object();
    }

    std::ostringstream line;
    line << event.stateName;

    if (event.kind == "RETRIED") {
        line << ": " << detail.value("error", "") << ", retry " << detail.value("attempt", 0)
             << " after " << detail.value("delay_ms", 0) << " ms";
        std::string cause = detail.value("cause", "");
        if (!cause.empty()) line << " (" << cause << ")";
    } else if (event.kind == "CAUGHT") {
        line << ": " << detail.value("error", "") << " handled, continuing at "
             << detail.value("next", "");
        std::string cause = detail.value("cause", "");
        if (!cause.empty()) line << " (" << cause << ")";
    } else if (event.kind == "BRANCHED") {
        line << ": " << detail.value("branch_count", 0) << " branches started";
    } else if (event.kind == "JOINED") {
        line << ":";
        if (detail.contains("branches") && detail["branches"].is_array()) {
            for (const auto& branch : detail["branches"]) {
                line << " [" << branch.value("index", 0) << "] " << branch.value("status", "");
                if (branch.contains("error")) {
                    line << " (" << branch.value("error", "") << ")";
                }
            }
        }
    }
    return line.str();
}

} // namespace workflow
} // namespace drflow
