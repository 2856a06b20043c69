#ifndef POSTURE_DATA_TYPES_H
#define POSTURE_DATA_TYPES_H

#include <string>
#include <cmath>

// Finished session row - one per session lifetime, fixed column order
struct StoredSessionRecord {
    std::string timestamp;          // end time, ISO8601
    std::string session_id;
    double session_seconds = 0.0;
    int    total_frames = 0;
    int    good_frames = 0;
    int    bad_frames = 0;
    double good_percent = 0.0;
    double bad_percent = 0.0;
    double average_score = 0.0;
    double longest_bad_secs = 0.0;
};

// Aggregate statistics across all stored sessions
struct StoreStatistics {
    int    total_sessions;
    double total_duration_seconds;
    double average_good_percent;
    double average_bad_percent;
    double average_score;

    StoreStatistics()
        : total_sessions(0), total_duration_seconds(0.0), average_good_percent(0.0),
          average_bad_percent(0.0), average_score(0.0) {}
};

// Numeric fields are stored with 2 decimals
inline double roundTo2(double v) {
    return std::round(v * 100.0) / 100.0;
}

#endif // POSTURE_DATA_TYPES_H
