#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace vision {

// Enumeration: per-frame posture labels (closed set, order follows the decision list).
enum class PostureLabel {
    NO_PERSON = 0,
    SEVERELY_SLOUCHED,
    SLIGHTLY_SLOUCHED,
    LEANING_FORWARD,
    LEANING_BACKWARD,
    SEVERE_LEAN_LEFT,
    SEVERE_LEAN_RIGHT,
    LEANING_LEFT,
    LEANING_RIGHT,
    GOOD_POSTURE,
    BAD_POSTURE
};

inline std::string toString(PostureLabel l) {
    switch (l) {
        case PostureLabel::NO_PERSON:         return "No person detected";
        case PostureLabel::SEVERELY_SLOUCHED: return "Severely Slouched";
        case PostureLabel::SLIGHTLY_SLOUCHED: return "Slightly Slouched";
        case PostureLabel::LEANING_FORWARD:   return "Leaning Forward";
        case PostureLabel::LEANING_BACKWARD:  return "Leaning Backward";
        case PostureLabel::SEVERE_LEAN_LEFT:  return "Severe Lean Left";
        case PostureLabel::SEVERE_LEAN_RIGHT: return "Severe Lean Right";
        case PostureLabel::LEANING_LEFT:      return "Leaning Left";
        case PostureLabel::LEANING_RIGHT:     return "Leaning Right";
        case PostureLabel::GOOD_POSTURE:      return "Good Posture";
        default:                              return "Bad Posture";
    }
}

// 严重程度颜色 (BGR), 用于标注图
inline cv::Scalar severityColor(PostureLabel l) {
    switch (l) {
        case PostureLabel::NO_PERSON:         return cv::Scalar(255, 0, 0);
        case PostureLabel::SEVERELY_SLOUCHED:
        case PostureLabel::BAD_POSTURE:       return cv::Scalar(0, 0, 255);
        case PostureLabel::GOOD_POSTURE:      return cv::Scalar(0, 255, 0);
        default:                              return cv::Scalar(0, 165, 255);
    }
}

// good flag is derived from the label text ("Good" substring)
inline bool isGoodLabel(PostureLabel l) {
    return toString(l).find("Good") != std::string::npos;
}

} // namespace vision
