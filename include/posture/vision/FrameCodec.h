#pragma once
#include <QByteArray>
#include <opencv2/core.hpp>

namespace vision {

// base64 text -> BGR image; throws posture::InputDecodeError on bad base64,
// undecodable bytes, non 3-channel images or frames below the minimum size
cv::Mat decodeBase64Frame(const QByteArray& base64, int min_w = 100, int min_h = 100);

// raw encoded bytes (jpg/png/...) -> BGR image, same checks as above
cv::Mat decodeImageBytes(const QByteArray& bytes, int min_w = 100, int min_h = 100);

// BGR image -> base64 JPEG (annotated_image field)
QByteArray encodeJpegBase64(const cv::Mat& bgr, int quality = 90);

} // namespace vision
