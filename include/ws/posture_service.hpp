#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "posture/net_types.hpp"
#include "posture/session/session_registry.hpp"
#include "posture/session/session_store.hpp"
#include "posture/vision/Config.h"
#include "posture/vision/PostureAnalyzer.h"

/* 请求/响应式接口 (非流式)
*  每个操作返回 JSON 对象; 失败抛 posture::* 异常, handleRequest 统一映射成 code
*  200 成功 / 400 输入错误 / 404 未找到 / 409 已结束 / 500 内部错误
*/
class PostureService {
public:
    PostureService(posture::SessionRegistry& registry,
                   posture::SessionStore& store,
                   const vision::PostureAnalyzer& analyzer,
                   const vision::PostureConfig& cfg);

    // {"action": name, ...params} -> result with "code"
    QJsonObject handleRequest(const QJsonObject& request);

    QJsonObject health() const;
    QJsonObject startSession();
    QJsonObject analyzeFrame(const QString& session_id, const QByteArray& frame, bool draw_landmarks = true);
    QJsonObject endSession(const QString& session_id);
    QJsonObject sessionStatus(const QString& session_id) const;
    QJsonObject history(int limit = 10);
    QJsonObject statistics();
    QJsonObject activeSessions() const;
    QJsonObject deleteSession(const QString& session_id);
    QJsonObject quickAnalyze(const QByteArray& frame, bool draw_landmarks = true);

    static QJsonObject withCode(QJsonObject reply, int code);

private:
    posture::SessionRegistry::EntryPtr requireSession(const QString& session_id) const;
    QString annotate(const cv::Mat& image, const vision::FrameResult& result, bool draw_landmarks) const;

    posture::SessionRegistry&       registry_;
    posture::SessionStore&          store_;
    const vision::PostureAnalyzer&  analyzer_;
    const vision::PostureConfig&    cfg_;
};
