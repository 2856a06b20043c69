#include "posture/vision/Types.h"

namespace vision {

const char* bodyPointName(BodyPoint p) {
    switch (p) {
        case BodyPoint::NOSE:           return "NOSE";
        case BodyPoint::LEFT_EYE:       return "LEFT_EYE";
        case BodyPoint::RIGHT_EYE:      return "RIGHT_EYE";
        case BodyPoint::LEFT_EAR:       return "LEFT_EAR";
        case BodyPoint::RIGHT_EAR:      return "RIGHT_EAR";
        case BodyPoint::LEFT_SHOULDER:  return "LEFT_SHOULDER";
        case BodyPoint::RIGHT_SHOULDER: return "RIGHT_SHOULDER";
        case BodyPoint::LEFT_ELBOW:     return "LEFT_ELBOW";
        case BodyPoint::RIGHT_ELBOW:    return "RIGHT_ELBOW";
        case BodyPoint::LEFT_WRIST:     return "LEFT_WRIST";
        case BodyPoint::RIGHT_WRIST:    return "RIGHT_WRIST";
        case BodyPoint::LEFT_HIP:       return "LEFT_HIP";
        case BodyPoint::RIGHT_HIP:      return "RIGHT_HIP";
        case BodyPoint::LEFT_KNEE:      return "LEFT_KNEE";
        case BodyPoint::RIGHT_KNEE:     return "RIGHT_KNEE";
        case BodyPoint::LEFT_ANKLE:     return "LEFT_ANKLE";
        case BodyPoint::RIGHT_ANKLE:    return "RIGHT_ANKLE";
    }
    return "UNKNOWN";
}

PostureLabel labelOf(const FrameResult& r) {
    if (const auto* d = std::get_if<Detected>(&r)) return d->classification.label;
    return PostureLabel::NO_PERSON;
}

int scoreOf(const FrameResult& r) {
    if (const auto* d = std::get_if<Detected>(&r)) return d->score;
    return 0;
}

bool isGoodPosture(const FrameResult& r) {
    if (const auto* d = std::get_if<Detected>(&r)) return d->classification.is_good;
    return false;
}

cv::Scalar colorOf(const FrameResult& r) {
    if (const auto* d = std::get_if<Detected>(&r)) return d->classification.color;
    return severityColor(PostureLabel::NO_PERSON);
}

const PostureMetrics* metricsOf(const FrameResult& r) {
    if (const auto* d = std::get_if<Detected>(&r)) return &d->metrics;
    return nullptr;
}

} // namespace vision
