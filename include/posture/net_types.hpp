#pragma once
// 网络/WS 相关的载荷类型（流式帧消息、统计快照等）

#include <QtCore/QByteArray>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include "posture/db/DataTypes.h"
#include "posture/session/posture_session.hpp"
#include "posture/vision/Types.h"

namespace posture {

// Inbound stream message
struct StreamMessage {
    enum class Type { Frame, Ping, EndSession, Unknown };

    Type       type = Type::Unknown;
    QString    type_name;       // raw "type" field, for error replies
    QByteArray frame;           // base64 payload of a frame message

    // false on malformed JSON or a non-object document
    static bool parse(const QByteArray& text, StreamMessage& out, QString* err = nullptr);
};

double round2(double v);

// full snapshot (final_stats, session_status, ...)
QJsonObject statsToJson(const SessionStatistics& s);

// condensed snapshot embedded into every Nth frame reply
QJsonObject condensedStatsToJson(const SessionStatistics& s);

// neck/spine/shoulder; with_distance adds nose_shoulder_distance
QJsonObject metricsToJson(const vision::PostureMetrics& m, bool with_distance = false);

QJsonArray landmarksToJson(const vision::LandmarkSet& landmarks);

// {"status":"success","posture_status",...,"timestamp","metrics"?}
QJsonObject frameResultToJson(const vision::FrameResult& r, const QString& timestamp);

QJsonObject recordToJson(const StoredSessionRecord& r);
QJsonObject storeStatsToJson(const StoreStatistics& s);

QJsonObject errorReply(const QString& message);
QJsonObject pongReply();

QByteArray toCompactJson(const QJsonObject& o);

} // namespace posture
