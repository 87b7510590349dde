#include "dcmx/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

#ifdef _WIN32
#define timegm _mkgmtime
#endif

namespace dcmx {
namespace time {

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_milliseconds() {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

TimePoint from_timestamp(uint64_t timestamp_seconds) {
    return TimePoint(Seconds(timestamp_seconds));
}

std::string to_string(const TimePoint& tp) {
    // Floor to whole seconds so pre-epoch instants keep a non-negative fraction
    auto whole = std::chrono::floor<Seconds>(tp);
    auto time_t_val = Clock::to_time_t(whole);
    std::tm tm_val;

#ifdef DCMX_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    auto ms = std::chrono::floor<Milliseconds>(tp - whole).count();

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

TimePoint from_string(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);

    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("Failed to parse time string: " + str);
    }

    // Fractional seconds: keep millisecond precision, ignore further digits
    int ms = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            char c = static_cast<char>(iss.get());
            if (digits < 3) {
                ms = ms * 10 + (c - '0');
            }
            ++digits;
        }
        if (digits == 0) {
            throw std::invalid_argument("Missing fraction digits: " + str);
        }
        for (; digits < 3; ++digits) {
            ms *= 10;
        }
    }

    // Zone designator: Z, +HH:MM or -HH:MM
    int offset_minutes = 0;
    int next = iss.peek();
    if (next == 'Z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        int sign = (iss.get() == '-') ? -1 : 1;
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        iss >> hours >> colon >> minutes;
        if (iss.fail() || colon != ':') {
            throw std::invalid_argument("Invalid UTC offset: " + str);
        }
        offset_minutes = sign * (hours * 60 + minutes);
    }

    auto time_t_val = timegm(&tm_val);
    auto tp = Clock::from_time_t(time_t_val);
    tp += Milliseconds(ms);
    tp -= std::chrono::minutes(offset_minutes);

    return tp;
}

} // namespace time
} // namespace dcmx
