#pragma once
#include "Types.h"
#include "OrtPose.h"
#include <opencv2/core.hpp>
#include <optional>

namespace vision {

/* 姿态分析
*  landmarks -> metrics -> (label, color, good flag) + score
*  the free functions are pure; PostureAnalyzer only adds the detector call in front
*/

// angle at vertex b formed by a-b-c, degrees; 0 when either arm has zero length
double calculateAngle(const cv::Point& a, const cv::Point& b, const cv::Point& c);

// landmarks are normalized (0~1) and scaled to frame pixels here
PostureMetrics computeMetrics(const LandmarkSet& landmarks, int frame_w, int frame_h);

// first-match decision list, evaluated strictly top to bottom
Classification classifyPosture(const PostureMetrics& m, const PostureThresholds& t = PostureThresholds{});

// clamp(100 - 0.4*|175-neck| - 0.4*spine - 0.4*shoulder, 0, 100), truncated
int computePostureScore(double neck_angle, double spine_tilt, double shoulder_tilt,
                        const PostureThresholds& t = PostureThresholds{});

// metrics + classification + score for one frame; nullopt landmarks -> NoDetection
FrameResult evaluateLandmarks(const std::optional<LandmarkSet>& landmarks,
                              int frame_w, int frame_h,
                              const PostureThresholds& t = PostureThresholds{});

class PostureAnalyzer {
public:
    PostureAnalyzer(PoseDetector& detector, const PostureThresholds& thresholds);

    // full pipeline for a decoded BGR frame
    FrameResult analyzeFrame(const cv::Mat& bgr) const;

    // 标注: 骨架 + 状态文本 + 分数, 返回新图像
    cv::Mat drawPostureInfo(const cv::Mat& bgr, const FrameResult& result, bool draw_landmarks = true) const;

    const PostureThresholds& thresholds() const { return thresholds_; }

private:
    PoseDetector&     detector_;    // 不持有
    PostureThresholds thresholds_;
};

} // namespace vision
