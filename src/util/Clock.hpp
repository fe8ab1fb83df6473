#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace rit {

/// Source of commit timestamps; injectable so tests can pin the time
using TimestampSource = std::function<std::string()>;

/**
 * @brief Format a time point as ISO-8601 UTC with millisecond precision
 *
 * Example: "2024-03-01T12:34:56.789Z"
 */
std::string formatIsoTimestamp(std::chrono::system_clock::time_point when);

/// Current wall-clock time as formatted by formatIsoTimestamp
std::string currentIsoTimestamp();

}
