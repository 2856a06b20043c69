#pragma once
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.h"

namespace vision {

// 关键点检测器接口: BGR 图像 -> 关键点集合 (无人时返回 nullopt)
class PoseDetector {
public:
    virtual ~PoseDetector() = default;
    virtual std::optional<LandmarkSet> detect(const cv::Mat& bgr) = 0;
};

struct RawPose {        // 原始人体检测数据结构(model output, input-space pixels)
    float cx, cy, w, h;
    float conf;
    std::array<float, kBodyPointCount * 3> kpts;  // x, y, visibility
};

class OrtPoseDetector : public PoseDetector {
public:
    struct SessionOptions {
        std::string model_path = "assets/weights/yolov8n-pose.onnx";
        int input_w = 640;
        int input_h = 640;
        float conf_threshold = 0.5f;
        float keypoint_threshold = 0.3f;
        int intra_threads = 0;
        bool fake_infer = false;
    };

    explicit OrtPoseDetector(const SessionOptions& opt);
    ~OrtPoseDetector() override = default;

    bool isReady() const;
    std::optional<LandmarkSet> detect(const cv::Mat& bgr) override;

    // resized 640x640 letterboxed input
    std::vector<RawPose> infer(const cv::Mat& letterboxed);

private:
    struct Letterbox {
        cv::Mat img;
        float scale;
        int dx, dy;
    };
    static Letterbox sizeParse(const cv::Mat& src, int target_w, int target_h);
    static LandmarkSet fakeSkeleton();

    SessionOptions opt_;
    bool ready_ = false;

    // onnx runtime session
    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<Ort::Session> session_;
};

} // namespace vision
