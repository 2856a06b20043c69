#include "posture/net_types.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

namespace posture {

bool StreamMessage::parse(const QByteArray& text, StreamMessage& out, QString* err) {
    QJsonParseError error;
    const auto document = QJsonDocument::fromJson(text, &error);
    if (error.error != QJsonParseError::NoError) {
        if (err) *err = QStringLiteral("Invalid JSON: ") + error.errorString();
        return false;
    }
    if (!document.isObject()) {
        if (err) *err = QStringLiteral("Invalid message: expected a JSON object");
        return false;
    }

    const auto obj = document.object();
    out.type_name = obj.value("type").toString();
    out.frame.clear();

    if (out.type_name == "frame") {
        out.type = Type::Frame;
        out.frame = obj.value("frame").toString().toLatin1();
    } else if (out.type_name == "ping") {
        out.type = Type::Ping;
    } else if (out.type_name == "end_session") {
        out.type = Type::EndSession;
    } else {
        out.type = Type::Unknown;
    }
    return true;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

QJsonObject statsToJson(const SessionStatistics& s) {
    QJsonObject o{
        {"session_id", QString::fromStdString(s.session_id)},
        {"start_time", QString::fromStdString(s.start_time)},
        {"duration_seconds", round2(s.duration_seconds)},
        {"total_frames", s.total_frames},
        {"good_frames", s.good_frames},
        {"bad_frames", s.bad_frames},
        {"good_percent", round2(s.good_percent)},
        {"bad_percent", round2(s.bad_percent)},
        {"average_score", round2(s.average_score)},
        {"longest_bad_duration", round2(s.longest_bad_duration)},
        {"current_bad_duration", round2(s.current_bad_duration)}
    };
    if (!s.end_time.empty()) o["end_time"] = QString::fromStdString(s.end_time);
    return o;
}

QJsonObject condensedStatsToJson(const SessionStatistics& s) {
    return {
        {"total_frames", s.total_frames},
        {"good_percent", round2(s.good_percent)},
        {"bad_percent", round2(s.bad_percent)},
        {"average_score", round2(s.average_score)},
        {"current_bad_duration", round2(s.current_bad_duration)},
        {"longest_bad_duration", round2(s.longest_bad_duration)}
    };
}

QJsonObject metricsToJson(const vision::PostureMetrics& m, bool with_distance) {
    QJsonObject o{
        {"neck_angle", round2(m.neck_angle)},
        {"spine_tilt", round2(m.spine_tilt)},
        {"shoulder_tilt", round2(m.shoulder_tilt)}
    };
    if (with_distance) o["nose_shoulder_distance"] = round2(m.nose_shoulder_distance);
    return o;
}

QJsonArray landmarksToJson(const vision::LandmarkSet& landmarks) {
    QJsonArray arr;
    for (int i = 0; i < vision::kBodyPointCount; ++i) {
        const auto& lm = landmarks.points[i];
        arr.append(QJsonObject{
            {"index", i},
            {"name", vision::bodyPointName(static_cast<vision::BodyPoint>(i))},
            {"x", lm.x},
            {"y", lm.y},
            {"z", lm.z},
            {"visibility", lm.visibility}
        });
    }
    return arr;
}

QJsonObject frameResultToJson(const vision::FrameResult& r, const QString& timestamp) {
    QJsonObject o{
        {"status", "success"},
        {"posture_status", QString::fromStdString(vision::toString(vision::labelOf(r)))},
        {"posture_score", vision::scoreOf(r)},
        {"is_good_posture", vision::isGoodPosture(r)},
        {"timestamp", timestamp}
    };
    if (const auto* m = vision::metricsOf(r)) o["metrics"] = metricsToJson(*m);
    return o;
}

QJsonObject recordToJson(const StoredSessionRecord& r) {
    return {
        {"timestamp", QString::fromStdString(r.timestamp)},
        {"session_id", QString::fromStdString(r.session_id)},
        {"session_seconds", r.session_seconds},
        {"total_frames", r.total_frames},
        {"good_frames", r.good_frames},
        {"bad_frames", r.bad_frames},
        {"good_percent", r.good_percent},
        {"bad_percent", r.bad_percent},
        {"average_score", r.average_score},
        {"longest_bad_secs", r.longest_bad_secs}
    };
}

QJsonObject storeStatsToJson(const StoreStatistics& s) {
    return {
        {"total_sessions", s.total_sessions},
        {"total_duration_seconds", s.total_duration_seconds},
        {"average_good_percent", s.average_good_percent},
        {"average_bad_percent", s.average_bad_percent},
        {"average_score", s.average_score}
    };
}

QJsonObject errorReply(const QString& message) {
    return {{"status", "error"}, {"message", message}};
}

QJsonObject pongReply() {
    return {{"type", "pong"}};
}

QByteArray toCompactJson(const QJsonObject& o) {
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

} // namespace posture
