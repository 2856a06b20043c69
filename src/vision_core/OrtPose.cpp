#include "posture/vision/OrtPose.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace vision {
    // OrtPoseDetector initializor
    OrtPoseDetector::OrtPoseDetector(const SessionOptions& opt)
        : opt_(opt),
          env_(ORT_LOGGING_LEVEL_WARNING, "YOLOv8n-pose"),
          session_options_()
    {
        if (opt_.fake_infer) {
            ready_ = true;
            std::cout << "[OrtPoseDetector] fake infer mode, fixed upright skeleton\n";
            return;
        }
        if (!std::filesystem::exists(opt_.model_path)) {
            std::cerr << "[OrtPoseDetector] model not found: " << opt_.model_path << ", falling back to fake infer\n";
            opt_.fake_infer = true;
            ready_ = true;
            return;
        }

        session_options_.SetIntraOpNumThreads(opt_.intra_threads);   // 0 = auto decide threads usage

        try {
#ifdef _WIN32
            std::wstring model_path_w(opt_.model_path.begin(), opt_.model_path.end());
            session_ = std::make_unique<Ort::Session>(env_, model_path_w.c_str(), session_options_);
#else
            session_ = std::make_unique<Ort::Session>(env_, opt_.model_path.c_str(), session_options_);
#endif
            ready_ = true;
            std::cout << "[OrtPoseDetector] ONNX session created with model: " << opt_.model_path << "\n";
        } catch (const Ort::Exception& ex) {
            std::cerr << "[OrtPoseDetector] Failed to create ONNX session: " << ex.what() << "\n";
            ready_ = false; // remain not ready; detect() reports no person
        }
    }

    bool OrtPoseDetector::isReady() const { return ready_; }

    // letterbox: keep aspect ratio, pad to target size
    OrtPoseDetector::Letterbox OrtPoseDetector::sizeParse(const cv::Mat& src, int target_w, int target_h) {
        int w = src.cols, h = src.rows;
        float scaling_rate = std::min((float)target_w / w, (float)target_h / h);
        int new_w = int(std::round(w * scaling_rate));
        int new_h = int(std::round(h * scaling_rate));
        int dx = (target_w - new_w) / 2;
        int dy = (target_h - new_h) / 2;

        cv::Mat resized;
        cv::resize(src, resized, cv::Size(new_w, new_h));

        cv::Mat canvas(target_h, target_w, src.type(), cv::Scalar(114, 114, 114));
        resized.copyTo(canvas(cv::Rect(dx, dy, new_w, new_h)));
        return {canvas, scaling_rate, dx, dy};
    }

    LandmarkSet OrtPoseDetector::fakeSkeleton() {
        LandmarkSet s;
        auto put = [&s](BodyPoint p, float x, float y) { s[p] = Landmark{x, y, 0.f, 1.f}; };
        put(BodyPoint::NOSE,           0.50f, 0.20f);
        put(BodyPoint::LEFT_EYE,       0.52f, 0.17f);
        put(BodyPoint::RIGHT_EYE,      0.48f, 0.17f);
        put(BodyPoint::LEFT_EAR,       0.55f, 0.19f);
        put(BodyPoint::RIGHT_EAR,      0.45f, 0.19f);
        put(BodyPoint::LEFT_SHOULDER,  0.60f, 0.55f);
        put(BodyPoint::RIGHT_SHOULDER, 0.40f, 0.55f);
        put(BodyPoint::LEFT_ELBOW,     0.66f, 0.75f);
        put(BodyPoint::RIGHT_ELBOW,    0.34f, 0.75f);
        put(BodyPoint::LEFT_WRIST,     0.62f, 0.90f);
        put(BodyPoint::RIGHT_WRIST,    0.38f, 0.90f);
        put(BodyPoint::LEFT_HIP,       0.58f, 0.95f);
        put(BodyPoint::RIGHT_HIP,      0.42f, 0.95f);
        // 坐姿, 膝踝不在画面内
        return s;
    }

    std::optional<LandmarkSet> OrtPoseDetector::detect(const cv::Mat& bgr) {
        if (bgr.empty()) return std::nullopt;
        if (opt_.fake_infer) return fakeSkeleton();
        if (!session_ || !ready_) return std::nullopt;

        // 1. 预处理：letterbox（保持比例，减少形变）
        auto lb = sizeParse(bgr, opt_.input_w, opt_.input_h);

        // 2. 推理
        std::vector<RawPose> poses = infer(lb.img);
        if (poses.empty()) return std::nullopt;

        // single subject: keep the most confident person
        const RawPose& best = *std::max_element(poses.begin(), poses.end(),
            [](const RawPose& a, const RawPose& b) { return a.conf < b.conf; });

        // 3. 关键点映射回原图归一化坐标
        LandmarkSet out;
        const float W = static_cast<float>(bgr.cols);
        const float H = static_cast<float>(bgr.rows);
        for (int k = 0; k < kBodyPointCount; ++k) {
            float x = (best.kpts[k * 3]     - lb.dx) / lb.scale;
            float y = (best.kpts[k * 3 + 1] - lb.dy) / lb.scale;
            out.points[k].x = std::clamp(x / W, 0.f, 1.f);
            out.points[k].y = std::clamp(y / H, 0.f, 1.f);
            out.points[k].visibility = best.kpts[k * 3 + 2];
        }

        // 鼻/肩/髋为指标计算所必需
        const BodyPoint required[] = {
            BodyPoint::NOSE, BodyPoint::LEFT_SHOULDER, BodyPoint::RIGHT_SHOULDER,
            BodyPoint::LEFT_HIP, BodyPoint::RIGHT_HIP
        };
        for (BodyPoint p : required) {
            if (out[p].visibility < opt_.keypoint_threshold) return std::nullopt;
        }
        return out;
    }

    std::vector<RawPose> OrtPoseDetector::infer(const cv::Mat& letterboxed) {
        if (!session_ || !ready_) return {};

        if (letterboxed.empty() || letterboxed.cols != opt_.input_w || letterboxed.rows != opt_.input_h) {
            std::cerr << "[OrtPoseDetector] Input image size mismatch. Expected "
                      << opt_.input_w << "x" << opt_.input_h << ", got "
                      << letterboxed.cols << "x" << letterboxed.rows << "\n";
            return {};
        }

        // 1/ I/O node info ("images", [1, 3, 640, 640]) -> ("output0", [1, 56, 8400])
        Ort::AllocatorWithDefaultOptions allocator;
        Ort::AllocatedStringPtr input_name_ptr = session_->GetInputNameAllocated(0, allocator);
        Ort::AllocatedStringPtr output_name_ptr = session_->GetOutputNameAllocated(0, allocator);
        const char* input_name = input_name_ptr.get();
        const char* output_name = output_name_ptr.get();

        // 2/ Preprocess (bgr->rgb, hwc->nchw, normalize)
        cv::Mat rgb;
        cv::cvtColor(letterboxed, rgb, cv::COLOR_BGR2RGB);

        std::vector<float> input_tensor_val(1 * 3 * opt_.input_w * opt_.input_h);
        for (int c = 0; c < 3; ++c) {
            for (int h = 0; h < opt_.input_h; ++h) {
                for (int w = 0; w < opt_.input_w; ++w) {
                    int idx = c * opt_.input_h * opt_.input_w + h * opt_.input_w + w;
                    input_tensor_val[idx] = rgb.at<cv::Vec3b>(h, w)[c] / 255.0f;
                }
            }
        }

        // 3/ input tensor prepare
        std::vector<int64_t> input_shape = {1, 3, opt_.input_h, opt_.input_w};
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info,
            input_tensor_val.data(),
            input_tensor_val.size(),
            input_shape.data(),
            input_shape.size()
        );

        // 4/ Inference run
        std::vector<const char*> input_names = {input_name};
        std::vector<const char*> output_names = {output_name};
        auto output_tensors = session_->Run(
            Ort::RunOptions{nullptr},
            input_names.data(),  &input_tensor, 1,
            output_names.data(), 1
        );

        // 5/ Analysis output tensor: attrs-first [cx,cy,w,h,conf, 17 x (x,y,v)]
        float* output_data = output_tensors[0].GetTensorMutableData<float>();
        auto output_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();

        int num_boxes = static_cast<int>(output_shape.size()>=3 ? output_shape[2] : 0);
        int num_attrs = static_cast<int>(output_shape.size()>=2 ? output_shape[1] : 0);

        if (num_attrs != 5 + kBodyPointCount * 3) {
            std::cerr << "[OrtPoseDetector] Unexpected attributes count: " << num_attrs << "\n";
            return {};
        }

        std::vector<RawPose> poses;
        for (int i = 0; i < num_boxes; ++i) {
            float conf = output_data[4 * num_boxes + i];
            if (conf < opt_.conf_threshold) continue;

            RawPose p;
            p.cx = output_data[i];
            p.cy = output_data[num_boxes + i];
            p.w  = output_data[2 * num_boxes + i];
            p.h  = output_data[3 * num_boxes + i];
            p.conf = conf;
            for (int k = 0; k < kBodyPointCount * 3; ++k) {
                p.kpts[k] = output_data[(5 + k) * num_boxes + i];
            }
            poses.push_back(p);
        }
        return poses;
    }
} // namespace vision
