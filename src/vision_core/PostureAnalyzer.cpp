#include "posture/vision/PostureAnalyzer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace vision {

namespace {

// python-style floor division, midpoints of pixel coordinates
inline int floorDiv2(int v) { return v >= 0 ? v / 2 : -((-v + 1) / 2); }

inline cv::Point toPixel(const Landmark& lm, int w, int h) {
    return cv::Point(static_cast<int>(lm.x * w), static_cast<int>(lm.y * h));
}

inline cv::Point midpoint(const cv::Point& a, const cv::Point& b) {
    return cv::Point(floorDiv2(a.x + b.x), floorDiv2(a.y + b.y));
}

// COCO-17 骨架连线
const int kEdges[][2] = {
    {0,1},{0,2},{1,3},{2,4},
    {5,6},{5,7},{7,9},{6,8},{8,10},
    {5,11},{6,12},{11,12},
    {11,13},{13,15},{12,14},{14,16}
};

} // namespace

double calculateAngle(const cv::Point& a, const cv::Point& b, const cv::Point& c) {
    const double bax = a.x - b.x, bay = a.y - b.y;
    const double bcx = c.x - b.x, bcy = c.y - b.y;

    const double dot = bax * bcx + bay * bcy;
    const double mag_ba = std::sqrt(bax * bax + bay * bay);
    const double mag_bc = std::sqrt(bcx * bcx + bcy * bcy);

    if (mag_ba * mag_bc == 0.0) return 0.0;   // degenerate pose

    const double cos_val = std::clamp(dot / (mag_ba * mag_bc), -1.0, 1.0);
    return std::acos(cos_val) * 180.0 / CV_PI;
}

PostureMetrics computeMetrics(const LandmarkSet& lm, int frame_w, int frame_h) {
    const cv::Point l_shoulder = toPixel(lm[BodyPoint::LEFT_SHOULDER], frame_w, frame_h);
    const cv::Point r_shoulder = toPixel(lm[BodyPoint::RIGHT_SHOULDER], frame_w, frame_h);
    const cv::Point l_hip      = toPixel(lm[BodyPoint::LEFT_HIP], frame_w, frame_h);
    const cv::Point r_hip      = toPixel(lm[BodyPoint::RIGHT_HIP], frame_w, frame_h);
    const cv::Point nose       = toPixel(lm[BodyPoint::NOSE], frame_w, frame_h);

    const cv::Point neck    = midpoint(l_shoulder, r_shoulder);   // 颈部 = 双肩中点
    const cv::Point mid_hip = midpoint(l_hip, r_hip);

    PostureMetrics m;
    m.neck_angle     = calculateAngle(nose, neck, mid_hip);
    m.spine_tilt     = std::abs(neck.x - mid_hip.x);
    m.shoulder_tilt  = std::abs(l_shoulder.y - r_shoulder.y);
    m.shoulder_mid_x = floorDiv2(l_shoulder.x + r_shoulder.x);
    m.shoulder_avg_y = floorDiv2(l_shoulder.y + r_shoulder.y);
    m.nose_shoulder_distance = std::abs(nose.y - m.shoulder_avg_y);
    m.nose_x = nose.x;
    m.nose_y = nose.y;
    return m;
}

Classification classifyPosture(const PostureMetrics& m, const PostureThresholds& t) {
    // NOTE: left/right labels are mirrored w.r.t. the image x axis (nose right of center -> "Left")
    PostureLabel label;
    if (m.nose_y > m.shoulder_avg_y + t.head_drop) {
        label = PostureLabel::SEVERELY_SLOUCHED;
    } else if (m.nose_y > m.shoulder_avg_y + t.head_drop / 2) {
        label = PostureLabel::SLIGHTLY_SLOUCHED;
    } else if (m.nose_shoulder_distance < t.forward_dist) {
        label = PostureLabel::LEANING_FORWARD;
    } else if (m.nose_shoulder_distance > t.backward_dist) {
        label = PostureLabel::LEANING_BACKWARD;
    } else if (m.nose_x > m.shoulder_mid_x + t.lean * 2.4) {
        label = PostureLabel::SEVERE_LEAN_LEFT;
    } else if (m.nose_x < m.shoulder_mid_x - t.lean * 2.4) {
        label = PostureLabel::SEVERE_LEAN_RIGHT;
    } else if (m.nose_x > m.shoulder_mid_x + t.lean * 0.5) {
        label = PostureLabel::LEANING_LEFT;
    } else if (m.nose_x < m.shoulder_mid_x - t.lean * 0.5) {
        label = PostureLabel::LEANING_RIGHT;
    } else if (m.neck_angle >= t.neck_angle - t.tolerance &&
               m.spine_tilt <= t.spine_tilt + t.tolerance &&
               m.shoulder_tilt <= t.shoulder_tilt + t.tolerance) {
        label = PostureLabel::GOOD_POSTURE;
    } else {
        label = PostureLabel::BAD_POSTURE;
    }
    return Classification{label, severityColor(label), isGoodLabel(label)};
}

int computePostureScore(double neck_angle, double spine_tilt, double shoulder_tilt,
                        const PostureThresholds& t) {
    double score = 100.0;
    score -= std::abs(t.neck_angle - neck_angle) * 0.4;
    score -= spine_tilt * 0.4;
    score -= shoulder_tilt * 0.4;
    return std::clamp(static_cast<int>(score), 0, 100);
}

FrameResult evaluateLandmarks(const std::optional<LandmarkSet>& landmarks,
                              int frame_w, int frame_h,
                              const PostureThresholds& t) {
    if (!landmarks) return NoDetection{};

    Detected d;
    d.landmarks      = *landmarks;
    d.metrics        = computeMetrics(*landmarks, frame_w, frame_h);
    d.classification = classifyPosture(d.metrics, t);
    d.score          = computePostureScore(d.metrics.neck_angle, d.metrics.spine_tilt,
                                           d.metrics.shoulder_tilt, t);
    return d;
}

PostureAnalyzer::PostureAnalyzer(PoseDetector& detector, const PostureThresholds& thresholds)
    : detector_(detector), thresholds_(thresholds) {}

FrameResult PostureAnalyzer::analyzeFrame(const cv::Mat& bgr) const {
    return evaluateLandmarks(detector_.detect(bgr), bgr.cols, bgr.rows, thresholds_);
}

cv::Mat PostureAnalyzer::drawPostureInfo(const cv::Mat& bgr, const FrameResult& result, bool draw_landmarks) const {
    cv::Mat canvas = bgr.clone();
    const cv::Scalar color = colorOf(result);
    const auto* detected = std::get_if<Detected>(&result);

    if (!detected) {
        cv::putText(canvas, toString(PostureLabel::NO_PERSON), cv::Point(30, 30),
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, color, 2);
        return canvas;
    }

    if (draw_landmarks) {
        for (const auto& e : kEdges) {
            const cv::Point a = toPixel(detected->landmarks.points[e[0]], canvas.cols, canvas.rows);
            const cv::Point b = toPixel(detected->landmarks.points[e[1]], canvas.cols, canvas.rows);
            cv::line(canvas, a, b, cv::Scalar(0, 0, 255), 2);
        }
        for (const auto& lm : detected->landmarks.points) {
            cv::circle(canvas, toPixel(lm, canvas.cols, canvas.rows), 2, cv::Scalar(0, 255, 0), 2);
        }
    }

    cv::putText(canvas, "Posture: " + toString(detected->classification.label), cv::Point(30, 30),
                cv::FONT_HERSHEY_SIMPLEX, 1.0, color, 2);
    cv::putText(canvas, "Score: " + std::to_string(detected->score), cv::Point(30, 70),
                cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255, 0, 0), 2);
    return canvas;
}

} // namespace vision
