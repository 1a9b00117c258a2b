#include "workflow/TimeUtil.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drflow {
namespace workflow {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time -= 1;
    }

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& str) {
    std::tm utc{};
    std::istringstream iss(str);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + str);
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits += static_cast<char>(iss.get());
        }
        while (digits.size() < 3) digits += '0';
        millis = std::stoi(digits.substr(0, 3));
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&utc));
    return tp + std::chrono::milliseconds(millis);
}

} // namespace workflow
} // namespace drflow
