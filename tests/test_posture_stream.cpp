#include <gtest/gtest.h>

#include <ws/posture_stream.hpp>

#include "posture/db/SessionDatabase.h"
#include "posture/vision/FrameCodec.h"

#include <QJsonDocument>
#include <QJsonObject>

#include <optional>

using namespace vision;

namespace {

class UprightDetector : public PoseDetector {
public:
    std::optional<LandmarkSet> detect(const cv::Mat&) override {
        LandmarkSet lm;
        auto set = [&](BodyPoint p, float x, float y) { lm[p] = Landmark{x, y, 0.f, 0.9f}; };
        set(BodyPoint::NOSE,           0.50f, 0.20f);
        set(BodyPoint::LEFT_SHOULDER,  0.60f, 0.55f);
        set(BodyPoint::RIGHT_SHOULDER, 0.40f, 0.55f);
        set(BodyPoint::LEFT_HIP,       0.58f, 0.95f);
        set(BodyPoint::RIGHT_HIP,      0.42f, 0.95f);
        return lm;
    }
};

QJsonObject parse(const QByteArray& text) {
    return QJsonDocument::fromJson(text).object();
}

class PostureStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.initialize());
        frame_b64 = encodeJpegBase64(cv::Mat(480, 640, CV_8UC3, cv::Scalar(40, 40, 40)));
        ASSERT_FALSE(frame_b64.isEmpty());
    }

    QByteArray frameMessage() const {
        return QJsonDocument(QJsonObject{{"type", "frame"}, {"frame", QString::fromLatin1(frame_b64)}})
            .toJson(QJsonDocument::Compact);
    }

    int liveFrames(const QString& id) {
        auto entry = registry.find(id.toStdString());
        if (!entry) return -1;
        return posture::SessionRegistry::withSession(entry, [](posture::PostureSession& s) {
            return s.statistics().total_frames;
        });
    }

    UprightDetector detector;
    PostureAnalyzer analyzer{detector, PostureThresholds{}};
    PostureConfig cfg;
    posture::SessionRegistry registry;
    SessionDatabase db{":memory:"};
    QByteArray frame_b64;
};

} // namespace

TEST_F(PostureStreamTest, OpenCreatesSessionImplicitly) {
    PostureStream stream(registry, db, analyzer, cfg);
    EXPECT_EQ(stream.state(), PostureStream::State::CONNECTING);
    EXPECT_TRUE(stream.open("desk-1"));
    EXPECT_EQ(stream.state(), PostureStream::State::STREAMING);
    EXPECT_NE(registry.find("desk-1"), nullptr);
}

TEST_F(PostureStreamTest, EmptyIdGetsGeneratedOne) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open(QString());
    EXPECT_FALSE(stream.sessionId().isEmpty());
    EXPECT_NE(registry.find(stream.sessionId().toStdString()), nullptr);
}

TEST_F(PostureStreamTest, FrameReplyCarriesResult) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");

    const auto out = stream.handleText(frameMessage());
    ASSERT_EQ(out.replies.size(), 1);
    EXPECT_FALSE(out.close_transport);

    const QJsonObject reply = parse(out.replies.first());
    EXPECT_EQ(reply["status"].toString(), "success");
    EXPECT_EQ(reply["posture_status"].toString(), "Good Posture");
    EXPECT_TRUE(reply["is_good_posture"].toBool());
    EXPECT_TRUE(reply.contains("timestamp"));
    ASSERT_TRUE(reply.contains("metrics"));
    EXPECT_TRUE(reply["metrics"].toObject().contains("neck_angle"));
    EXPECT_FALSE(reply.contains("session_stats"));
    EXPECT_EQ(liveFrames("desk-1"), 1);
}

TEST_F(PostureStreamTest, EveryTenthFrameEmbedsStats) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");

    for (int i = 1; i <= 20; ++i) {
        const QJsonObject reply = parse(stream.handleText(frameMessage()).replies.first());
        if (i % 10 == 0) {
            ASSERT_TRUE(reply.contains("session_stats")) << "frame " << i;
            EXPECT_EQ(reply["session_stats"].toObject()["total_frames"].toInt(), i);
        } else {
            EXPECT_FALSE(reply.contains("session_stats")) << "frame " << i;
        }
    }
}

TEST_F(PostureStreamTest, BadFrameLeavesSessionUntouched) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");

    const auto out = stream.handleText(R"({"type":"frame","frame":"@@not-base64@@"})");
    const QJsonObject reply = parse(out.replies.first());
    EXPECT_EQ(reply["status"].toString(), "error");
    EXPECT_TRUE(reply["message"].toString().startsWith("Invalid frame"));
    EXPECT_EQ(liveFrames("desk-1"), 0);
    EXPECT_EQ(stream.state(), PostureStream::State::STREAMING);
}

TEST_F(PostureStreamTest, PingGetsPong) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");
    const QJsonObject reply = parse(stream.handleText(R"({"type":"ping"})").replies.first());
    EXPECT_EQ(reply["type"].toString(), "pong");
}

TEST_F(PostureStreamTest, UnknownOrMalformedMessagesKeepStreaming) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");

    QJsonObject reply = parse(stream.handleText(R"({"type":"dance"})").replies.first());
    EXPECT_EQ(reply["status"].toString(), "error");
    EXPECT_TRUE(reply["message"].toString().contains("dance"));

    reply = parse(stream.handleText("{not json").replies.first());
    EXPECT_EQ(reply["status"].toString(), "error");

    reply = parse(stream.handleText("[1,2,3]").replies.first());
    EXPECT_EQ(reply["status"].toString(), "error");

    EXPECT_EQ(stream.state(), PostureStream::State::STREAMING);
}

TEST_F(PostureStreamTest, EndSessionSavesAndCloses) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");
    stream.handleText(frameMessage());
    stream.handleText(frameMessage());

    const auto out = stream.handleText(R"({"type":"end_session"})");
    EXPECT_TRUE(out.close_transport);
    const QJsonObject reply = parse(out.replies.first());
    EXPECT_EQ(reply["status"].toString(), "success");
    EXPECT_EQ(reply["message"].toString(), "Session ended and saved");
    EXPECT_TRUE(reply["saved_to_database"].toBool());
    const QJsonObject final_stats = reply["final_stats"].toObject();
    EXPECT_EQ(final_stats["total_frames"].toInt(), 2);
    EXPECT_TRUE(final_stats.contains("end_time"));

    EXPECT_EQ(stream.state(), PostureStream::State::CLOSED);
    EXPECT_EQ(registry.find("desk-1"), nullptr);
    ASSERT_EQ(db.getAllSessions().size(), 1u);
    EXPECT_EQ(db.getAllSessions()[0].total_frames, 2);

    // transport closing afterwards must not write again
    stream.onDisconnected();
    EXPECT_EQ(db.getAllSessions().size(), 1u);

    const QJsonObject late = parse(stream.handleText(R"({"type":"ping"})").replies.first());
    EXPECT_EQ(late["status"].toString(), "error");
}

TEST_F(PostureStreamTest, DisconnectFinalizesOnce) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-1");
    stream.handleText(frameMessage());

    stream.onDisconnected();
    EXPECT_EQ(stream.state(), PostureStream::State::CLOSED);
    EXPECT_EQ(registry.find("desk-1"), nullptr);
    EXPECT_EQ(db.getAllSessions().size(), 1u);

    stream.onDisconnected();
    EXPECT_EQ(db.getAllSessions().size(), 1u);
}

TEST_F(PostureStreamTest, DestroyedStreamStillSaves) {
    {
        PostureStream stream(registry, db, analyzer, cfg);
        stream.open("desk-1");
        stream.handleText(frameMessage());
    }
    EXPECT_EQ(registry.size(), 0u);
    ASSERT_EQ(db.getAllSessions().size(), 1u);
    EXPECT_EQ(db.getAllSessions()[0].session_id, "desk-1");
}

TEST_F(PostureStreamTest, SessionEndedByAnotherConnectionClosesStream) {
    PostureStream first(registry, db, analyzer, cfg);
    PostureStream second(registry, db, analyzer, cfg);
    EXPECT_TRUE(first.open("shared"));
    EXPECT_FALSE(second.open("shared"));

    first.handleText(frameMessage());
    first.handleText(R"({"type":"end_session"})");

    const auto out = second.handleText(frameMessage());
    EXPECT_TRUE(out.close_transport);
    EXPECT_EQ(parse(out.replies.first())["status"].toString(), "error");
    EXPECT_EQ(second.state(), PostureStream::State::CLOSED);

    second.onDisconnected();
    EXPECT_EQ(db.getAllSessions().size(), 1u);
}

TEST_F(PostureStreamTest, EndSessionAfterRequestPathEndedIsConflict) {
    PostureStream stream(registry, db, analyzer, cfg);
    stream.open("desk-2");
    stream.handleText(frameMessage());

    auto entry = registry.find("desk-2");
    ASSERT_NE(entry, nullptr);
    posture::SessionRegistry::withSession(entry, [&](posture::PostureSession& s) { return s.end(db); });
    ASSERT_EQ(db.getAllSessions().size(), 1u);

    const auto out = stream.handleText(R"({"type":"end_session"})");
    EXPECT_TRUE(out.close_transport);
    const QJsonObject reply = parse(out.replies.first());
    EXPECT_EQ(reply["status"].toString(), "error");
    EXPECT_EQ(reply["message"].toString(), "Session desk-2 already ended");
    EXPECT_FALSE(reply.contains("saved_to_database"));

    EXPECT_EQ(stream.state(), PostureStream::State::CLOSED);
    EXPECT_EQ(registry.find("desk-2"), nullptr);
    EXPECT_EQ(db.getAllSessions().size(), 1u);
}
