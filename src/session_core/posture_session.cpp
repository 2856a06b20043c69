#include "posture/session/posture_session.hpp"
#include "posture/db/TimeUtils.h"
#include "posture/errors.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace posture {

StoredSessionRecord toStoredRecord(const SessionStatistics& stats) {
    StoredSessionRecord r;
    r.timestamp        = stats.end_time.empty() ? TimeUtils::nowIso8601() : stats.end_time;
    r.session_id       = stats.session_id;
    r.session_seconds  = stats.duration_seconds;
    r.total_frames     = stats.total_frames;
    r.good_frames      = stats.good_frames;
    r.bad_frames       = stats.bad_frames;
    r.good_percent     = stats.good_percent;
    r.bad_percent      = stats.bad_percent;
    r.average_score    = stats.average_score;
    r.longest_bad_secs = stats.longest_bad_duration;
    return r;
}

double PostureSession::BadRunTimer::elapsedSeconds(Clock::time_point now) const {
    if (!is_running) return 0.0;
    return std::max(0.0, TimeUtils::secondsBetween(start_time, now));
}

PostureSession::PostureSession(std::string session_id, Clock::time_point start)
    : session_id_(std::move(session_id)),
      start_steady_(start),
      start_time_(TimeUtils::nowIso8601())
{
}

void PostureSession::update(const vision::FrameResult& result, Clock::time_point now) {
    if (state_ == State::ENDED) throw SessionAlreadyEnded(session_id_);

    const bool is_good = vision::isGoodPosture(result);
    const int score = vision::scoreOf(result);

    // history first: the only steps that may throw, counters below are nothrow
    PostureHistoryEntry entry{TimeUtils::nowIso8601(), vision::labelOf(result), score};
    score_history_.push_back(score);
    try {
        posture_history_.push_back(std::move(entry));
    } catch (...) {
        score_history_.pop_back();
        throw;
    }

    ++total_frames_;
    score_sum_ += score;

    if (is_good) {
        ++good_frames_;
        // bad run over: commit and reset
        if (bad_run_.is_running) {
            longest_bad_duration_ = std::max(longest_bad_duration_, current_bad_duration_);
            bad_run_.is_running = false;
            current_bad_duration_ = 0.0;
        }
    } else {
        ++bad_frames_;
        if (!bad_run_.is_running) {
            bad_run_.is_running = true;
            bad_run_.start_time = now;
        } else {
            // wall-clock elapsed since the run started, not an increment
            current_bad_duration_ = bad_run_.elapsedSeconds(now);
        }
        longest_bad_duration_ = std::max(longest_bad_duration_, current_bad_duration_);
    }
}

SessionStatistics PostureSession::statistics(Clock::time_point now) const {
    SessionStatistics s;
    s.session_id = session_id_;
    s.start_time = start_time_;
    s.end_time   = end_time_;

    // an ended session is frozen at its end time
    const Clock::time_point until = (state_ == State::ENDED) ? end_steady_ : now;
    s.duration_seconds = std::max(0.0, TimeUtils::secondsBetween(start_steady_, until));

    s.total_frames = total_frames_;
    s.good_frames  = good_frames_;
    s.bad_frames   = bad_frames_;
    if (total_frames_ > 0) {
        s.good_percent = static_cast<double>(good_frames_) / total_frames_ * 100.0;
        s.bad_percent  = static_cast<double>(bad_frames_) / total_frames_ * 100.0;
    }
    if (!score_history_.empty()) {
        s.average_score = static_cast<double>(score_sum_) / score_history_.size();
    }
    s.longest_bad_duration = longest_bad_duration_;
    s.current_bad_duration = current_bad_duration_;
    return s;
}

EndReport PostureSession::end(SessionStore& store, Clock::time_point now) {
    if (state_ == State::ENDED) throw SessionAlreadyEnded(session_id_);

    state_ = State::ENDED;
    end_steady_ = now;
    end_time_ = TimeUtils::nowIso8601();

    EndReport report;
    report.stats = statistics(now);
    report.saved_to_database = store.appendSession(toStoredRecord(report.stats));
    if (!report.saved_to_database) {
        std::cerr << "[Session] " << session_id_ << " ended but the store write failed\n";
    }
    return report;
}

} // namespace posture
