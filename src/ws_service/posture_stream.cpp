#include <ws/posture_stream.hpp>

#include "posture/db/TimeUtils.h"
#include "posture/errors.hpp"
#include "posture/vision/FrameCodec.h"

#include <QDebug>
#include <QUuid>

PostureStream::PostureStream(posture::SessionRegistry& registry,
                             posture::SessionStore& store,
                             const vision::PostureAnalyzer& analyzer,
                             const vision::PostureConfig& cfg)
    : registry_(registry), store_(store), analyzer_(analyzer), cfg_(cfg)
{
}

PostureStream::~PostureStream() {
    // a stream torn down without close still has to save its session
    if (state_ == State::STREAMING) {
        try {
            onDisconnected();
        } catch (const std::exception& e) {
            qWarning() << "[Stream]" << session_id_ << "finalize on destroy failed:" << e.what();
        }
    }
}

bool PostureStream::open(const QString& session_id) {
    if (state_ != State::CONNECTING) return false;

    session_id_ = session_id.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : session_id;
    auto [entry, created] = registry_.findOrCreate(session_id_.toStdString());
    entry_ = entry;
    state_ = State::STREAMING;

    qInfo() << "[Stream] connected, session" << session_id_ << (created ? "(created)" : "(existing)");
    return created;
}

PostureStream::Outcome PostureStream::handleText(const QByteArray& text) {
    if (state_ != State::STREAMING) {
        return Outcome{{posture::toCompactJson(posture::errorReply("Stream is not active"))}, false};
    }

    posture::StreamMessage msg;
    QString err;
    if (!posture::StreamMessage::parse(text, msg, &err)) {
        qWarning() << "[Stream]" << session_id_ << err;
        return Outcome{{posture::toCompactJson(posture::errorReply(err))}, false};
    }

    switch (msg.type) {
        case posture::StreamMessage::Type::Frame:
            return onFrame(msg.frame);
        case posture::StreamMessage::Type::Ping:
            return Outcome{{posture::toCompactJson(posture::pongReply())}, false};
        case posture::StreamMessage::Type::EndSession:
            return onEndSession();
        case posture::StreamMessage::Type::Unknown:
            break;
    }
    qDebug() << "[Stream] unknown message type:" << msg.type_name;
    return Outcome{{posture::toCompactJson(posture::errorReply("Unknown message type: " + msg.type_name))}, false};
}

PostureStream::Outcome PostureStream::onFrame(const QByteArray& base64) {
    // 1. 解码 + 推理: 全部完成后才会触碰会话
    vision::FrameResult result;
    try {
        const cv::Mat image = vision::decodeBase64Frame(base64, cfg_.min_frame_w, cfg_.min_frame_h);
        result = analyzer_.analyzeFrame(image);
    } catch (const posture::InputDecodeError& e) {
        qWarning() << "[Stream]" << session_id_ << "frame decode failed:" << e.what();
        return Outcome{{posture::toCompactJson(posture::errorReply(QString("Invalid frame: ") + e.what()))}, false};
    } catch (const std::exception& e) {
        qWarning() << "[Stream]" << session_id_ << "frame analysis failed:" << e.what();
        return Outcome{{posture::toCompactJson(posture::errorReply(QString("Error analyzing frame: ") + e.what()))}, false};
    }

    // 2. 会话更新 (single atomic step under the session lock)
    posture::SessionStatistics stats;
    try {
        stats = posture::SessionRegistry::withSession(entry_, [&](posture::PostureSession& s) {
            s.update(result);
            return s.statistics();
        });
    } catch (const posture::SessionAlreadyEnded& e) {
        // ended from the request path; nothing left to stream into
        qWarning() << "[Stream]" << session_id_ << e.what();
        registry_.remove(session_id_.toStdString(), entry_);
        state_ = State::CLOSED;
        return Outcome{{posture::toCompactJson(posture::errorReply(e.what()))}, true};
    }

    // 3. 回复; 每 N 帧附带统计快照
    QJsonObject reply = posture::frameResultToJson(result, QString::fromStdString(TimeUtils::nowIso8601()));
    const int every = cfg_.stats_every_n_frames > 0 ? cfg_.stats_every_n_frames : 10;
    if (stats.total_frames % every == 0) {
        reply["session_stats"] = posture::condensedStatsToJson(stats);
    }
    return Outcome{{posture::toCompactJson(reply)}, false};
}

PostureStream::Outcome PostureStream::onEndSession() {
    bool ended_here = false;
    const posture::EndReport report = finalize(&ended_here);

    if (!ended_here) {
        // ended from the request path; its row is already stored
        const posture::SessionAlreadyEnded err(session_id_.toStdString());
        qWarning() << "[Stream]" << err.what();
        return Outcome{{posture::toCompactJson(posture::errorReply(err.what()))}, true};
    }

    QJsonObject reply{
        {"status", "success"},
        {"message", report.saved_to_database ? "Session ended and saved" : "Session ended but save failed"},
        {"final_stats", posture::statsToJson(report.stats)},
        {"saved_to_database", report.saved_to_database}
    };
    qInfo() << "[Stream] session" << session_id_ << "ended by client, frames =" << report.stats.total_frames;
    return Outcome{{posture::toCompactJson(reply)}, true};
}

void PostureStream::onDisconnected() {
    if (state_ != State::STREAMING) {
        state_ = State::CLOSED;
        return;
    }
    bool ended_here = false;
    const posture::EndReport report = finalize(&ended_here);
    if (ended_here) {
        qInfo() << "[Stream] session" << session_id_ << "finalized on disconnect, saved =" << report.saved_to_database;
    }
}

posture::EndReport PostureStream::finalize(bool* ended_here) {
    posture::EndReport report;
    *ended_here = false;

    if (entry_) {
        report = posture::SessionRegistry::withSession(entry_, [&](posture::PostureSession& s) {
            if (s.isActive()) {
                *ended_here = true;
                return s.end(store_);
            }
            // already ended elsewhere: report the frozen snapshot, no second write
            posture::EndReport r;
            r.stats = s.statistics();
            return r;
        });
        registry_.remove(session_id_.toStdString(), entry_);
    }
    state_ = State::CLOSED;
    return report;
}
