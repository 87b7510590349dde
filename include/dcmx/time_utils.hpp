#pragma once

#include "dcmx/common.hpp"
#include <chrono>
#include <string>
#include <thread>

namespace dcmx {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (milliseconds since epoch)
uint64_t timestamp_milliseconds();

// Convert Unix timestamp to TimePoint
TimePoint from_timestamp(uint64_t timestamp_seconds);

// Convert TimePoint to string (ISO 8601, UTC, millisecond precision)
std::string to_string(const TimePoint& tp);

// Parse ISO 8601 string to TimePoint; throws std::invalid_argument on malformed input.
// Accepts a trailing 'Z', a "+00:00" offset, and up to microsecond fractions.
TimePoint from_string(const std::string& str);

// Duration utilities
template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Milliseconds>(duration).count();
}

// Sleep utilities
inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace dcmx
