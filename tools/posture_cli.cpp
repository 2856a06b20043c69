/*
*   Name:  posture_cli.cpp
*   Usage: posture_cli [--config config/posture.yml] [--db out/posture_sessions.db] <command> [args]
*          history [N]                  last N stored sessions (default 10)
*          stats                        aggregate statistics over stored sessions
*          delete <session_id>          remove one stored session
*          clear                        remove every stored session
*          analyze <image> [out_image]  single image analysis, optional annotated output
*   ==========================================================================================
*   Offline access to the session store and the posture analyzer, output as JSON
*/
#include "posture/db/SessionDatabase.h"
#include "posture/vision/Config.h"
#include "posture/vision/OrtPose.h"
#include "posture/vision/PostureAnalyzer.h"

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

static double r2(double v) { return std::round(v * 100.0) / 100.0; }

static json toJson(const StoredSessionRecord& r) {
    return {
        {"timestamp", r.timestamp},
        {"session_id", r.session_id},
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

static void usage() {
    std::cerr << "usage: posture_cli [--config file] [--db file] history [N] | stats | delete <id> | clear | analyze <image> [out]\n";
}

static int runAnalyze(const vision::PostureConfig& cfg, const std::string& image_path, const std::string& out_path) {
    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "[CLI] cannot read image: " << image_path << "\n";
        return 1;
    }
    if (image.cols < cfg.min_frame_w || image.rows < cfg.min_frame_h) {
        std::cerr << "[CLI] image dimensions too small: " << image.cols << "x" << image.rows << "\n";
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
        std::cerr << "[CLI] pose detector not ready\n";
        return 1;
    }

    vision::PostureAnalyzer analyzer(detector, cfg.thresholds);
    const vision::FrameResult result = analyzer.analyzeFrame(image);

    json out{
        {"image", image_path},
        {"posture_status", vision::toString(vision::labelOf(result))},
        {"posture_score", vision::scoreOf(result)},
        {"is_good_posture", vision::isGoodPosture(result)}
    };
    if (const auto* m = vision::metricsOf(result)) {
        out["metrics"] = {
            {"neck_angle", r2(m->neck_angle)},
            {"spine_tilt", r2(m->spine_tilt)},
            {"shoulder_tilt", r2(m->shoulder_tilt)},
            {"nose_shoulder_distance", r2(m->nose_shoulder_distance)}
        };
    }

    if (!out_path.empty()) {
        const cv::Mat annotated = analyzer.drawPostureInfo(image, result, true);
        const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, cfg.annotated_jpg_quality};
        if (!cv::imwrite(out_path, annotated, params)) {
            std::cerr << "[CLI] failed to write " << out_path << "\n";
            return 1;
        }
        out["annotated_image"] = out_path;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string cfg_path = "config/posture.yml";
    std::string db_override;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cfg_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_override = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        usage();
        return 2;
    }

    vision::PostureConfig cfg;
    if (std::filesystem::exists(cfg_path)) {
        cfg = std::filesystem::path(cfg_path).extension() == ".json"
            ? vision::PostureConfig::fromJson(cfg_path)
            : vision::PostureConfig::fromYaml(cfg_path);
    }
    if (!db_override.empty()) cfg.db_path = db_override;

    const std::string& cmd = args[0];
    if (cmd == "analyze") {
        if (args.size() < 2) { usage(); return 2; }
        return runAnalyze(cfg, args[1], args.size() > 2 ? args[2] : std::string());
    }

    SessionDatabase db(cfg.db_path);
    if (!db.initialize()) {
        std::cerr << "[CLI] cannot open database: " << cfg.db_path << "\n";
        return 1;
    }

    if (cmd == "history") {
        int limit = 10;
        if (args.size() > 1) {
            try { limit = std::stoi(args[1]); } catch (const std::exception&) { std::cerr << "[CLI] bad limit: " << args[1] << "\n"; return 2; }
        }
        if (limit <= 0) { std::cerr << "[CLI] limit must be positive\n"; return 2; }
        json sessions = json::array();
        for (const auto& r : db.getRecentSessions(limit)) sessions.push_back(toJson(r));
        std::cout << json{{"count", sessions.size()}, {"sessions", sessions}}.dump(2) << "\n";
        return 0;
    }
    if (cmd == "stats") {
        const StoreStatistics s = db.getStatistics();
        std::cout << json{
            {"total_sessions", s.total_sessions},
            {"total_duration_seconds", s.total_duration_seconds},
            {"average_good_percent", s.average_good_percent},
            {"average_bad_percent", s.average_bad_percent},
            {"average_score", s.average_score}
        }.dump(2) << "\n";
        return 0;
    }
    if (cmd == "delete") {
        if (args.size() < 2) { usage(); return 2; }
        const bool removed = db.deleteSession(args[1]);
        std::cout << json{{"session_id", args[1]}, {"deleted", removed}}.dump(2) << "\n";
        return removed ? 0 : 1;
    }
    if (cmd == "clear") {
        const bool ok = db.clearAllSessions();
        std::cout << json{{"cleared", ok}}.dump(2) << "\n";
        return ok ? 0 : 1;
    }

    usage();
    return 2;
}
