#pragma once
#include <string>
#include "Types.h"

namespace vision {

// Posture server running config (load from posture.yml)
struct PostureConfig {
    // ===================== 字段fields ===================== //

    // 服务端
    std::string listen_host  = "127.0.0.1";
    int         listen_port  = 8000;
    std::string server_name  = "Posture-WS";
    std::string db_path      = "out/posture_sessions.db";   // SQLite file for finished sessions

    // 关键点模型
    std::string model_path   = "assets/weights/yolov8n-pose.onnx";
    int   input_w            = 640;
    int   input_h            = 640;
    float conf_thres_person  = 0.50f;   // 人框置信度阈值
    float conf_thres_keypoint = 0.30f;  // 关键点可见度阈值, 鼻/肩/髋低于此值视为未检测
    bool  fake_infer         = false;   // 无模型时使用固定骨架
    int   intra_threads      = 0;       // 0=auto

    // 输入图像校验
    int min_frame_w = 100;
    int min_frame_h = 100;

    // 流式会话: 每 N 帧附带一次统计快照
    int stats_every_n_frames = 10;

    // 标注图
    int annotated_jpg_quality = 90;

    // 姿态判定阈值
    PostureThresholds thresholds;

    // ===================== 方法methods ===================== //

    // 配置加载函数
    static PostureConfig fromYaml(const std::string& yaml_path);
    static PostureConfig fromJson(const std::string& json_path);
};

} // namespace vision
