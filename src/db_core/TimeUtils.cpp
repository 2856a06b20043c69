#include "posture/db/TimeUtils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

std::tm TimeUtils::toLocalTm(std::time_t t) {
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &t);
#else
    localtime_r(&t, &local_tm);
#endif
    return local_tm;
}

std::string TimeUtils::toIso8601(std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    if (micros < 0) micros += 1000000;   // pre-epoch values round toward zero

    std::tm tm = toLocalTm(std::chrono::system_clock::to_time_t(secs));

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string TimeUtils::nowIso8601() {
    return toIso8601(std::chrono::system_clock::now());
}

double TimeUtils::secondsBetween(std::chrono::steady_clock::time_point start,
                                 std::chrono::steady_clock::time_point end) {
    return std::chrono::duration<double>(end - start).count();
}
