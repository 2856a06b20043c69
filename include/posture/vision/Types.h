#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <variant>
#include <vector>
#include "Enums.h"

namespace vision {

// 关键点索引（COCO-17 格式）
enum class BodyPoint : int {
    NOSE = 0,
    LEFT_EYE,
    RIGHT_EYE,
    LEFT_EAR,
    RIGHT_EAR,
    LEFT_SHOULDER,
    RIGHT_SHOULDER,
    LEFT_ELBOW,
    RIGHT_ELBOW,
    LEFT_WRIST,
    RIGHT_WRIST,
    LEFT_HIP,
    RIGHT_HIP,
    LEFT_KNEE,
    RIGHT_KNEE,
    LEFT_ANKLE,
    RIGHT_ANKLE
};

constexpr int kBodyPointCount = 17;

const char* bodyPointName(BodyPoint p);

// 单个关键点: 归一化坐标 (0~1) + 深度 + 可见度
struct Landmark {
    float x = 0.f;
    float y = 0.f;
    float z = 0.f;            // 2-D detectors leave this at 0
    float visibility = 0.f;
};

// 单帧关键点集合 (immutable once produced by the detector)
struct LandmarkSet {
    std::array<Landmark, kBodyPointCount> points{};

    const Landmark& operator[](BodyPoint p) const { return points[static_cast<int>(p)]; }
    Landmark&       operator[](BodyPoint p)       { return points[static_cast<int>(p)]; }
};

// 姿态指标 (pixel / degree units, one per frame)
struct PostureMetrics {
    double neck_angle = 0.0;              // nose -> neck -> mid-hip, degrees [0,180]
    double spine_tilt = 0.0;              // |neck.x - mid_hip.x|
    double shoulder_tilt = 0.0;           // |l_shoulder.y - r_shoulder.y|
    double nose_shoulder_distance = 0.0;  // |nose.y - shoulder_avg_y|
    int shoulder_mid_x = 0;
    int nose_x = 0;
    int nose_y = 0;
    int shoulder_avg_y = 0;
};

/* 判定阈值
*  base thresholds are tuned for the reference frame size; no normalization is applied
*/
struct PostureThresholds {
    double neck_angle     = 175.0;
    double spine_tilt     = 10.0;
    double shoulder_tilt  = 25.0;
    double tolerance      = 3.0;    // only applied to the good-posture rule
    double lean           = 30.0;
    int    head_drop      = 60;
    double forward_dist   = 140.0;  // nose_shoulder_distance below -> leaning forward
    double backward_dist  = 200.0;  // nose_shoulder_distance above -> leaning backward
};

struct Classification {
    PostureLabel label = PostureLabel::BAD_POSTURE;
    cv::Scalar   color;
    bool         is_good = false;
};

// no skeleton found in the frame; metrics are absent by construction
struct NoDetection {};

struct Detected {
    PostureMetrics metrics;
    Classification classification;
    int            score = 0;
    LandmarkSet    landmarks;
};

using FrameResult = std::variant<NoDetection, Detected>;

PostureLabel labelOf(const FrameResult& r);
int          scoreOf(const FrameResult& r);
bool         isGoodPosture(const FrameResult& r);
cv::Scalar   colorOf(const FrameResult& r);

// nullptr for NoDetection
const PostureMetrics* metricsOf(const FrameResult& r);

} // namespace vision
