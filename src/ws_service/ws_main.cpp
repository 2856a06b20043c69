#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QHostAddress>

#include <ws/posture_service.hpp>
#include <ws/ws_hub.hpp>

#include "posture/db/SessionDatabase.h"
#include "posture/session/session_registry.hpp"
#include "posture/vision/Config.h"
#include "posture/vision/OrtPose.h"
#include "posture/vision/PostureAnalyzer.h"

#include <string>

static vision::PostureConfig loadConfig(const QString& path) {
    if (!QFileInfo::exists(path)) {
        qWarning() << "[Main] config" << path << "not found, using defaults";
        return vision::PostureConfig{};
    }
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix == "json") return vision::PostureConfig::fromJson(path.toStdString());
    return vision::PostureConfig::fromYaml(path.toStdString());
}

int main(int argc, char* argv[]){
    QCoreApplication app(argc, argv);

    const QString cfg_path = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QStringLiteral("config/posture.yml");
    const vision::PostureConfig cfg = loadConfig(cfg_path);

    // 打开数据库
    SessionDatabase db(cfg.db_path);
    if (!db.initialize()) {
        qCritical() << "[Main] failed to open session database" << QString::fromStdString(cfg.db_path);
        return 1;
    }

    vision::OrtPoseDetector::SessionOptions so;
    so.model_path = cfg.model_path;
    so.input_w = cfg.input_w;
    so.input_h = cfg.input_h;
    so.conf_threshold = cfg.conf_thres_person;
    so.keypoint_threshold = cfg.conf_thres_keypoint;
    so.intra_threads = cfg.intra_threads;
    so.fake_infer = cfg.fake_infer;
    vision::OrtPoseDetector detector(so);
    if (!detector.isReady()) {
        qCritical() << "[Main] pose detector not ready";
        return 1;
    }

    vision::PostureAnalyzer analyzer(detector, cfg.thresholds);
    posture::SessionRegistry registry;
    PostureService service(registry, db, analyzer, cfg);

    WsHub hub(registry, db, analyzer, service, cfg);
    const QHostAddress host(QString::fromStdString(cfg.listen_host));
    if (!hub.start(static_cast<quint16>(cfg.listen_port), host)) return 1;

    qInfo() << "[Main] stream endpoint ws://" + QString::fromStdString(cfg.listen_host) + ":" + QString::number(cfg.listen_port) + WsHub::kStreamPath + "/<session_id>";
    return app.exec();
}
