#pragma once
#include <chrono>

namespace helm::util {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now() {
    return Clock::now();
}

// Seconds since the unix epoch, with sub-second precision
inline double to_unix_seconds(Timestamp t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

inline Timestamp from_unix_seconds(double seconds) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds)));
}

inline double seconds_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

inline Clock::duration seconds(double s) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(s));
}

} // namespace helm::util
