#include <gtest/gtest.h>

#include "posture/db/SessionDatabase.h"

#include <filesystem>
#include <string>

namespace {

StoredSessionRecord makeRecord(const std::string& id, double seconds, double good_pct, double score) {
    StoredSessionRecord r;
    r.timestamp = "2026-10-19T10:00:00.000000";
    r.session_id = id;
    r.session_seconds = seconds;
    r.total_frames = 10;
    r.good_frames = static_cast<int>(good_pct / 10.0);
    r.bad_frames = 10 - r.good_frames;
    r.good_percent = good_pct;
    r.bad_percent = 100.0 - good_pct;
    r.average_score = score;
    r.longest_bad_secs = 1.234;
    return r;
}

class SessionDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(db.initialize()); }
    SessionDatabase db{":memory:"};
};

} // namespace

TEST_F(SessionDatabaseTest, AppendAndReadBackRounded) {
    StoredSessionRecord r = makeRecord("s-1", 12.3456, 66.666, 81.005);
    ASSERT_TRUE(db.appendSession(r));

    const auto got = db.getSessionById("s-1");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->timestamp, r.timestamp);
    EXPECT_EQ(got->session_id, "s-1");
    EXPECT_DOUBLE_EQ(got->session_seconds, 12.35);
    EXPECT_EQ(got->total_frames, 10);
    EXPECT_EQ(got->good_frames, r.good_frames);
    EXPECT_EQ(got->bad_frames, r.bad_frames);
    EXPECT_DOUBLE_EQ(got->good_percent, 66.67);
    EXPECT_DOUBLE_EQ(got->bad_percent, 33.33);
    EXPECT_NEAR(got->average_score, 81.0, 0.011);
    EXPECT_DOUBLE_EQ(got->longest_bad_secs, 1.23);

    EXPECT_FALSE(db.getSessionById("missing").has_value());
}

TEST_F(SessionDatabaseTest, AllSessionsOldestFirst) {
    ASSERT_TRUE(db.appendSession(makeRecord("a", 1, 50, 50)));
    ASSERT_TRUE(db.appendSession(makeRecord("b", 2, 50, 50)));
    ASSERT_TRUE(db.appendSession(makeRecord("c", 3, 50, 50)));

    const auto all = db.getAllSessions();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].session_id, "a");
    EXPECT_EQ(all[2].session_id, "c");
}

TEST_F(SessionDatabaseTest, RecentSessionsAreTheLastN) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(db.appendSession(makeRecord("s" + std::to_string(i), i, 50, 50)));
    }
    const auto recent = db.getRecentSessions(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].session_id, "s3");
    EXPECT_EQ(recent[1].session_id, "s4");

    EXPECT_EQ(db.getRecentSessions(100).size(), 5u);
    EXPECT_TRUE(db.getRecentSessions(0).empty());
}

TEST_F(SessionDatabaseTest, DeleteAndClear) {
    ASSERT_TRUE(db.appendSession(makeRecord("keep", 1, 50, 50)));
    ASSERT_TRUE(db.appendSession(makeRecord("drop", 1, 50, 50)));

    EXPECT_TRUE(db.deleteSession("drop"));
    EXPECT_FALSE(db.deleteSession("drop"));
    EXPECT_EQ(db.getAllSessions().size(), 1u);

    EXPECT_TRUE(db.clearAllSessions());
    EXPECT_TRUE(db.getAllSessions().empty());
}

TEST_F(SessionDatabaseTest, StatisticsOnEmptyStore) {
    const StoreStatistics s = db.getStatistics();
    EXPECT_EQ(s.total_sessions, 0);
    EXPECT_DOUBLE_EQ(s.total_duration_seconds, 0.0);
    EXPECT_DOUBLE_EQ(s.average_score, 0.0);
}

TEST_F(SessionDatabaseTest, StatisticsSkipNonNumericFieldsPerColumn) {
    ASSERT_TRUE(db.appendSession(makeRecord("a", 10, 80, 90)));
    ASSERT_TRUE(db.appendSession(makeRecord("b", 20, 40, 70)));
    // a hand-edited row: score is text, the other fields still count
    ASSERT_TRUE(db.exec(
        "INSERT INTO posture_sessions (timestamp, session_id, session_seconds, total_frames, good_frames, "
        "bad_frames, good_percent, bad_percent, average_score, longest_bad_secs) "
        "VALUES ('2026-10-19T11:00:00', 'c', 30, 10, 6, 4, 60, 40, 'n/a', 0)"));

    const StoreStatistics s = db.getStatistics();
    EXPECT_EQ(s.total_sessions, 3);
    EXPECT_DOUBLE_EQ(s.total_duration_seconds, 60.0);
    EXPECT_DOUBLE_EQ(s.average_good_percent, 60.0);
    EXPECT_DOUBLE_EQ(s.average_bad_percent, 40.0);
    EXPECT_DOUBLE_EQ(s.average_score, 80.0);
}

TEST(SessionDatabaseFile, PersistsAcrossReopen) {
    const auto dir = std::filesystem::temp_directory_path() / "posture_db_test";
    std::filesystem::remove_all(dir);
    const std::string path = (dir / "nested" / "sessions.db").string();

    {
        SessionDatabase db(path);
        ASSERT_TRUE(db.initialize());
        ASSERT_TRUE(db.appendSession(makeRecord("persisted", 5, 100, 99)));
    }
    {
        SessionDatabase db(path);
        ASSERT_TRUE(db.initialize());
        const auto got = db.getSessionById("persisted");
        ASSERT_TRUE(got.has_value());
        EXPECT_DOUBLE_EQ(got->average_score, 99.0);
    }
    std::filesystem::remove_all(dir);
}
