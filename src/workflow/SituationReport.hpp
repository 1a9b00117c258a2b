#pragma once

#include "storage/ExecutionRecord.hpp"
#include <string>

namespace drflow {
namespace workflow {

/**
 * Human-readable summary of an execution for responders
 *
 * Lists status, timings, every state transition in order (with retries,
 * caught errors and per-branch join results) and the final error.
 */
class SituationReport {
public:
    static std::string render(const storage::ExecutionRecord& record);

private:
    static std::string describeEvent(const storage::EventRecord& event);
};

} // namespace workflow
} // namespace drflow
