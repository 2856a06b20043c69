#ifndef POSTURE_TIME_UTILS_H
#define POSTURE_TIME_UTILS_H

#include <string>
#include <chrono>
#include <ctime>

class TimeUtils {
public:
    // ISO8601 local time with microseconds, e.g. "2025-01-15T10:30:00.123456"
    static std::string toIso8601(std::chrono::system_clock::time_point tp);
    static std::string nowIso8601();

    static double secondsBetween(std::chrono::steady_clock::time_point start,
                                 std::chrono::steady_clock::time_point end);

private:
    static std::tm toLocalTm(std::time_t t);
};

#endif // POSTURE_TIME_UTILS_H
