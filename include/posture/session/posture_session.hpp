#pragma once
// 会话聚合: 每帧分类结果 -> 计数 / 不良姿态持续时长 / 分数历史

#include <chrono>
#include <string>
#include <vector>

#include "posture/vision/Types.h"
#include "posture/session/session_store.hpp"

namespace posture {

// Snapshot of a session at one point in time (raw values, rounding happens on output)
struct SessionStatistics {
    std::string session_id;
    std::string start_time;         // ISO8601
    std::string end_time;           // empty while the session is active
    double duration_seconds = 0.0;
    int    total_frames = 0;
    int    good_frames = 0;
    int    bad_frames = 0;
    double good_percent = 0.0;
    double bad_percent = 0.0;
    double average_score = 0.0;
    double longest_bad_duration = 0.0;
    double current_bad_duration = 0.0;
};

struct PostureHistoryEntry {
    std::string          timestamp;
    vision::PostureLabel label;
    int                  score;
};

struct EndReport {
    SessionStatistics stats;
    bool saved_to_database = false;
};

StoredSessionRecord toStoredRecord(const SessionStatistics& stats);

class PostureSession {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { ACTIVE, ENDED };

    explicit PostureSession(std::string session_id, Clock::time_point start = Clock::now());

    // one analysed frame; throws SessionAlreadyEnded when ENDED
    void update(const vision::FrameResult& result, Clock::time_point now = Clock::now());

    // pure read, any state
    SessionStatistics statistics(Clock::time_point now = Clock::now()) const;

    // ACTIVE -> ENDED, snapshot with end time handed to the store; irreversible.
    // A second call throws SessionAlreadyEnded and does not write.
    EndReport end(SessionStore& store, Clock::time_point now = Clock::now());

    const std::string& id() const { return session_id_; }
    State state() const { return state_; }
    bool isActive() const { return state_ == State::ACTIVE; }

    const std::vector<int>& scoreHistory() const { return score_history_; }
    const std::vector<PostureHistoryEntry>& postureHistory() const { return posture_history_; }

private:
    // tracking the current bad-posture run
    class BadRunTimer {
    public:
        bool is_running = false;
        Clock::time_point start_time;
        double elapsedSeconds(Clock::time_point now) const;
    };

    std::string session_id_;
    State state_ = State::ACTIVE;

    Clock::time_point start_steady_;
    Clock::time_point end_steady_;
    std::string start_time_;
    std::string end_time_;

    int total_frames_ = 0;
    int good_frames_ = 0;
    int bad_frames_ = 0;
    double current_bad_duration_ = 0.0;
    double longest_bad_duration_ = 0.0;
    BadRunTimer bad_run_;

    long long score_sum_ = 0;
    std::vector<int> score_history_;
    std::vector<PostureHistoryEntry> posture_history_;
};

} // namespace posture
