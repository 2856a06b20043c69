#include <gtest/gtest.h>

#include "posture/errors.hpp"
#include "posture/session/posture_session.hpp"
#include "posture/session/session_registry.hpp"

#include <chrono>
#include <thread>
#include <vector>

using posture::PostureSession;
using namespace std::chrono_literals;

namespace {

// in-memory store; `fail_writes` simulates an unavailable backend
class MemoryStore : public posture::SessionStore {
public:
    bool fail_writes = false;
    std::vector<StoredSessionRecord> rows;

    bool appendSession(const StoredSessionRecord& r) override {
        if (fail_writes) return false;
        rows.push_back(r);
        return true;
    }
    std::vector<StoredSessionRecord> getAllSessions() override { return rows; }
    std::vector<StoredSessionRecord> getRecentSessions(int) override { return rows; }
    std::optional<StoredSessionRecord> getSessionById(const std::string&) override { return std::nullopt; }
    bool deleteSession(const std::string&) override { return false; }
    bool clearAllSessions() override { rows.clear(); return true; }
    StoreStatistics getStatistics() override { return {}; }
};

vision::FrameResult goodFrame(int score = 90) {
    vision::Detected d;
    d.classification = vision::Classification{vision::PostureLabel::GOOD_POSTURE,
                                               vision::severityColor(vision::PostureLabel::GOOD_POSTURE), true};
    d.score = score;
    return d;
}

vision::FrameResult badFrame(int score = 40) {
    vision::Detected d;
    d.classification = vision::Classification{vision::PostureLabel::LEANING_FORWARD,
                                               vision::severityColor(vision::PostureLabel::LEANING_FORWARD), false};
    d.score = score;
    return d;
}

} // namespace

TEST(PostureSession, FreshSessionIsEmpty) {
    PostureSession s("fresh");
    const auto st = s.statistics();
    EXPECT_EQ(st.session_id, "fresh");
    EXPECT_FALSE(st.start_time.empty());
    EXPECT_TRUE(st.end_time.empty());
    EXPECT_EQ(st.total_frames, 0);
    EXPECT_DOUBLE_EQ(st.good_percent, 0.0);
    EXPECT_DOUBLE_EQ(st.bad_percent, 0.0);
    EXPECT_DOUBLE_EQ(st.average_score, 0.0);
    EXPECT_TRUE(s.isActive());
}

TEST(PostureSession, CountersAlwaysAddUp) {
    const auto t0 = PostureSession::Clock::now();
    PostureSession s("counts", t0);
    const bool pattern[] = {true, false, false, true, true, false, true, false, false, false, true};
    int n = 0;
    for (bool good : pattern) {
        s.update(good ? goodFrame() : badFrame(), t0 + std::chrono::milliseconds(100 * n));
        ++n;
        const auto st = s.statistics(t0 + std::chrono::milliseconds(100 * n));
        EXPECT_EQ(st.total_frames, n);
        EXPECT_EQ(st.good_frames + st.bad_frames, n);
    }
    EXPECT_EQ(s.scoreHistory().size(), static_cast<size_t>(n));
    EXPECT_EQ(s.postureHistory().size(), static_cast<size_t>(n));
}

TEST(PostureSession, NoDetectionCountsAsBadWithZeroScore) {
    PostureSession s("empty-room");
    s.update(vision::NoDetection{});
    const auto st = s.statistics();
    EXPECT_EQ(st.bad_frames, 1);
    EXPECT_EQ(st.good_frames, 0);
    EXPECT_DOUBLE_EQ(st.average_score, 0.0);
    ASSERT_EQ(s.postureHistory().size(), 1u);
    EXPECT_EQ(s.postureHistory()[0].label, vision::PostureLabel::NO_PERSON);
}

TEST(PostureSession, BadRunDurationUsesWallClock) {
    const auto t0 = PostureSession::Clock::now();
    PostureSession s("run", t0);

    s.update(badFrame(), t0);
    EXPECT_DOUBLE_EQ(s.statistics(t0).current_bad_duration, 0.0);
    s.update(badFrame(), t0 + 750ms);
    s.update(badFrame(), t0 + 1500ms);
    EXPECT_NEAR(s.statistics(t0 + 1500ms).current_bad_duration, 1.5, 1e-6);

    s.update(goodFrame(), t0 + 2000ms);
    const auto st = s.statistics(t0 + 2000ms);
    EXPECT_EQ(st.bad_frames, 3);
    EXPECT_EQ(st.good_frames, 1);
    EXPECT_DOUBLE_EQ(st.current_bad_duration, 0.0);
    EXPECT_NEAR(st.longest_bad_duration, 1.5, 1e-6);
    EXPECT_NEAR(st.bad_percent, 75.0, 1e-9);
    EXPECT_NEAR(st.average_score, (40.0 * 3 + 90.0) / 4.0, 1e-9);
    EXPECT_NEAR(st.duration_seconds, 2.0, 1e-6);
}

TEST(PostureSession, LongestNeverDecreases) {
    const auto t0 = PostureSession::Clock::now();
    PostureSession s("longest", t0);

    // first run 3s, second run 1s
    s.update(badFrame(), t0);
    s.update(badFrame(), t0 + 3s);
    s.update(goodFrame(), t0 + 4s);
    s.update(badFrame(), t0 + 5s);
    s.update(badFrame(), t0 + 6s);
    EXPECT_NEAR(s.statistics(t0 + 6s).longest_bad_duration, 3.0, 1e-6);
    s.update(goodFrame(), t0 + 7s);

    const auto st = s.statistics(t0 + 7s);
    EXPECT_NEAR(st.longest_bad_duration, 3.0, 1e-6);
    EXPECT_DOUBLE_EQ(st.current_bad_duration, 0.0);
}

TEST(PostureSession, EndTwiceWritesOnce) {
    MemoryStore store;
    const auto t0 = PostureSession::Clock::now();
    PostureSession s("twice", t0);
    s.update(goodFrame(), t0 + 1s);

    const auto report = s.end(store, t0 + 2s);
    EXPECT_TRUE(report.saved_to_database);
    EXPECT_FALSE(report.stats.end_time.empty());
    EXPECT_FALSE(s.isActive());

    EXPECT_THROW(s.end(store, t0 + 3s), posture::SessionAlreadyEnded);
    ASSERT_EQ(store.rows.size(), 1u);
    EXPECT_EQ(store.rows[0].session_id, "twice");
    EXPECT_EQ(store.rows[0].timestamp, report.stats.end_time);
    EXPECT_NEAR(store.rows[0].session_seconds, 2.0, 1e-6);
}

TEST(PostureSession, EndedSessionRejectsUpdatesAndFreezes) {
    MemoryStore store;
    const auto t0 = PostureSession::Clock::now();
    PostureSession s("frozen", t0);
    s.update(badFrame(), t0);
    s.end(store, t0 + 5s);

    EXPECT_THROW(s.update(goodFrame(), t0 + 6s), posture::SessionAlreadyEnded);
    const auto st = s.statistics(t0 + 60s);
    EXPECT_EQ(st.total_frames, 1);
    EXPECT_NEAR(st.duration_seconds, 5.0, 1e-6);
}

TEST(PostureSession, FailedStoreStillEnds) {
    MemoryStore store;
    store.fail_writes = true;
    PostureSession s("unsaved");
    s.update(goodFrame());

    const auto report = s.end(store);
    EXPECT_FALSE(report.saved_to_database);
    EXPECT_FALSE(s.isActive());
    EXPECT_EQ(report.stats.total_frames, 1);
}

TEST(SessionRegistry, CreateFindRemove) {
    posture::SessionRegistry registry;
    auto a = registry.create("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(registry.create("a"), nullptr);
    EXPECT_EQ(registry.find("a"), a);
    EXPECT_EQ(registry.find("b"), nullptr);

    auto [b, created] = registry.findOrCreate("b");
    EXPECT_TRUE(created);
    auto [b2, created2] = registry.findOrCreate("b");
    EXPECT_FALSE(created2);
    EXPECT_EQ(b, b2);
    EXPECT_EQ(registry.size(), 2u);

    EXPECT_EQ(registry.remove("a"), a);
    EXPECT_EQ(registry.remove("a"), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, RemoveWithExpectedKeepsNewerSession) {
    posture::SessionRegistry registry;
    auto old_entry = registry.create("x");
    registry.remove("x");
    auto new_entry = registry.create("x");

    EXPECT_EQ(registry.remove("x", old_entry), nullptr);
    EXPECT_EQ(registry.find("x"), new_entry);
}

TEST(SessionRegistry, WithSessionRunsUnderLock) {
    posture::SessionRegistry registry;
    auto entry = registry.create("locked");
    const int total = posture::SessionRegistry::withSession(entry, [](PostureSession& s) {
        s.update(goodFrame());
        return s.statistics().total_frames;
    });
    EXPECT_EQ(total, 1);
}

TEST(SessionRegistry, ConcurrentUpdatesOnOneSessionSerialize) {
    posture::SessionRegistry registry;
    auto entry = registry.create("shared");
    constexpr int kThreads = 4;
    constexpr int kFramesPerThread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([entry, t] {
            for (int i = 0; i < kFramesPerThread; ++i) {
                const bool good = (i + t) % 3 != 0;
                posture::SessionRegistry::withSession(entry, [&](PostureSession& s) {
                    s.update(good ? goodFrame() : badFrame());
                });
            }
        });
    }
    for (auto& w : workers) w.join();

    posture::SessionRegistry::withSession(entry, [](PostureSession& s) {
        const auto st = s.statistics();
        EXPECT_EQ(st.total_frames, kThreads * kFramesPerThread);
        EXPECT_EQ(st.good_frames + st.bad_frames, kThreads * kFramesPerThread);
        EXPECT_EQ(s.scoreHistory().size(), static_cast<size_t>(kThreads * kFramesPerThread));
        EXPECT_EQ(s.postureHistory().size(), static_cast<size_t>(kThreads * kFramesPerThread));
    });
}
