#pragma once

#include <chrono>
#include <string>

namespace drflow {
namespace workflow {

/**
 * UTC ISO 8601 with milliseconds: 2024-05-01T12:30:00.250Z
 */
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * Parse the format produced by formatTimestamp (milliseconds optional).
 * Throws std::invalid_argument on malformed input.
 */
std::chrono::system_clock::time_point parseTimestamp(const std::string& str);

inline std::string currentTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

} // namespace workflow
} // namespace drflow
