#include <ws/posture_service.hpp>

#include "posture/db/TimeUtils.h"
#include "posture/errors.hpp"
#include "posture/vision/FrameCodec.h"

#include <QDebug>
#include <QJsonArray>
#include <QUuid>

#include <stdexcept>
#include <variant>

PostureService::PostureService(posture::SessionRegistry& registry,
                               posture::SessionStore& store,
                               const vision::PostureAnalyzer& analyzer,
                               const vision::PostureConfig& cfg)
    : registry_(registry), store_(store), analyzer_(analyzer), cfg_(cfg)
{
}

QJsonObject PostureService::withCode(QJsonObject reply, int code) {
    reply["code"] = code;
    return reply;
}

QJsonObject PostureService::handleRequest(const QJsonObject& request) {
    const QString action = request.value("action").toString();
    const QString session_id = request.value("session_id").toString();
    const QByteArray frame = request.value("frame").toString().toLatin1();
    const bool draw_landmarks = request.value("draw_landmarks").toBool(true);

    try {
        if (action == "health")          return withCode(health(), 200);
        if (action == "start_session")   return withCode(startSession(), 200);
        if (action == "analyze_frame")   return withCode(analyzeFrame(session_id, frame, draw_landmarks), 200);
        if (action == "end_session")     return withCode(endSession(session_id), 200);
        if (action == "session_status")  return withCode(sessionStatus(session_id), 200);
        if (action == "history")         return withCode(history(request.value("limit").toInt(10)), 200);
        if (action == "statistics")      return withCode(statistics(), 200);
        if (action == "active_sessions") return withCode(activeSessions(), 200);
        if (action == "delete_session")  return withCode(deleteSession(session_id), 200);
        if (action == "quick_analyze")   return withCode(quickAnalyze(frame, draw_landmarks), 200);

        qDebug() << "[Service] unknown action:" << action;
        return withCode(posture::errorReply("Unknown action: " + action), 400);
    } catch (const posture::UnknownSession& e) {
        return withCode(posture::errorReply(e.what()), 404);
    } catch (const posture::SessionAlreadyEnded& e) {
        return withCode(posture::errorReply(e.what()), 409);
    } catch (const posture::InputDecodeError& e) {
        qWarning() << "[Service]" << action << "bad input:" << e.what();
        return withCode(posture::errorReply(QString("Invalid image format or corrupted image: ") + e.what()), 400);
    } catch (const std::invalid_argument& e) {
        return withCode(posture::errorReply(e.what()), 400);
    } catch (const std::exception& e) {
        qCritical() << "[Service]" << action << "failed:" << e.what();
        return withCode(posture::errorReply(QString("Internal server error: ") + e.what()), 500);
    }
}

QJsonObject PostureService::health() const {
    return {{"status", "healthy"}};
}

QJsonObject PostureService::startSession() {
    posture::SessionRegistry::EntryPtr entry;
    QString id;
    // uuid 碰撞几乎不可能, 仍然重试直到拿到新会话
    while (!entry) {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        entry = registry_.create(id.toStdString());
    }
    const auto stats = posture::SessionRegistry::withSession(entry, [](posture::PostureSession& s) {
        return s.statistics();
    });

    qInfo() << "[Service] started session" << id;
    return {
        {"status", "success"},
        {"session_id", id},
        {"message", "Posture session started successfully"},
        {"start_time", QString::fromStdString(stats.start_time)}
    };
}

QJsonObject PostureService::analyzeFrame(const QString& session_id, const QByteArray& frame, bool draw_landmarks) {
    auto entry = requireSession(session_id);

    // 先完成解码和分析, 失败不影响会话
    const cv::Mat image = vision::decodeBase64Frame(frame, cfg_.min_frame_w, cfg_.min_frame_h);
    const vision::FrameResult result = analyzer_.analyzeFrame(image);

    const auto stats = posture::SessionRegistry::withSession(entry, [&](posture::PostureSession& s) {
        s.update(result);
        return s.statistics();
    });

    QJsonObject reply = posture::frameResultToJson(result, QString::fromStdString(TimeUtils::nowIso8601()));
    reply["session_id"] = session_id;
    reply["session_stats"] = posture::statsToJson(stats);
    if (const auto* detected = std::get_if<vision::Detected>(&result)) {
        reply["metrics"] = posture::metricsToJson(detected->metrics, true);
        reply["landmarks"] = posture::landmarksToJson(detected->landmarks);
    }
    reply["annotated_image"] = annotate(image, result, draw_landmarks);
    return reply;
}

QJsonObject PostureService::endSession(const QString& session_id) {
    auto entry = requireSession(session_id);

    // end() throws SessionAlreadyEnded if a stream got there first
    const posture::EndReport report = posture::SessionRegistry::withSession(entry, [&](posture::PostureSession& s) {
        return s.end(store_);
    });
    registry_.remove(session_id.toStdString(), entry);

    qInfo() << "[Service] ended session" << session_id << "saved =" << report.saved_to_database;
    return {
        {"status", "success"},
        {"message", report.saved_to_database ? "Session ended and saved successfully" : "Session ended but save failed"},
        {"session_statistics", posture::statsToJson(report.stats)},
        {"saved_to_database", report.saved_to_database}
    };
}

QJsonObject PostureService::sessionStatus(const QString& session_id) const {
    auto entry = requireSession(session_id);
    const auto stats = posture::SessionRegistry::withSession(entry, [](posture::PostureSession& s) {
        return s.statistics();
    });
    return {
        {"status", "success"},
        {"session_id", session_id},
        {"statistics", posture::statsToJson(stats)},
        {"is_active", true}
    };
}

QJsonObject PostureService::history(int limit) {
    if (limit <= 0) throw std::invalid_argument("limit must be positive");

    QJsonArray sessions;
    for (const auto& record : store_.getRecentSessions(limit)) {
        sessions.append(posture::recordToJson(record));
    }
    return {
        {"status", "success"},
        {"count", sessions.size()},
        {"sessions", sessions}
    };
}

QJsonObject PostureService::statistics() {
    return {
        {"status", "success"},
        {"statistics", posture::storeStatsToJson(store_.getStatistics())}
    };
}

QJsonObject PostureService::activeSessions() const {
    QJsonArray active;
    for (const auto& entry : registry_.entries()) {
        const auto stats = posture::SessionRegistry::withSession(entry, [](posture::PostureSession& s) {
            return s.statistics();
        });
        active.append(QJsonObject{
            {"session_id", QString::fromStdString(stats.session_id)},
            {"statistics", posture::statsToJson(stats)}
        });
    }
    return {
        {"status", "success"},
        {"count", active.size()},
        {"active_sessions", active}
    };
}

QJsonObject PostureService::deleteSession(const QString& session_id) {
    if (session_id.isEmpty()) throw std::invalid_argument("session_id is required");
    if (!store_.deleteSession(session_id.toStdString())) {
        throw posture::UnknownSession(session_id.toStdString());
    }
    return {
        {"status", "success"},
        {"message", QString("Session %1 deleted successfully").arg(session_id)}
    };
}

QJsonObject PostureService::quickAnalyze(const QByteArray& frame, bool draw_landmarks) {
    const cv::Mat image = vision::decodeBase64Frame(frame, cfg_.min_frame_w, cfg_.min_frame_h);
    const vision::FrameResult result = analyzer_.analyzeFrame(image);

    QJsonObject reply{
        {"status", "success"},
        {"posture_status", QString::fromStdString(vision::toString(vision::labelOf(result)))},
        {"posture_score", vision::scoreOf(result)},
        {"is_good_posture", vision::isGoodPosture(result)},
        {"annotated_image", annotate(image, result, draw_landmarks)}
    };
    if (const auto* m = vision::metricsOf(result)) reply["metrics"] = posture::metricsToJson(*m, true);
    return reply;
}

posture::SessionRegistry::EntryPtr PostureService::requireSession(const QString& session_id) const {
    if (session_id.isEmpty()) throw std::invalid_argument("session_id is required");
    auto entry = registry_.find(session_id.toStdString());
    if (!entry) throw posture::UnknownSession(session_id.toStdString());
    return entry;
}

QString PostureService::annotate(const cv::Mat& image, const vision::FrameResult& result, bool draw_landmarks) const {
    const cv::Mat annotated = analyzer_.drawPostureInfo(image, result, draw_landmarks);
    return QString::fromLatin1(vision::encodeJpegBase64(annotated, cfg_.annotated_jpg_quality));
}
