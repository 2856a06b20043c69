#include "posture/vision/FrameCodec.h"
#include "posture/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

namespace vision {

cv::Mat decodeBase64Frame(const QByteArray& base64, int min_w, int min_h) {
    QByteArray payload = base64.trimmed();

    // tolerate data URLs ("data:image/jpeg;base64,....")
    if (payload.startsWith("data:")) {
        const int comma = payload.indexOf(',');
        if (comma < 0) throw posture::InputDecodeError("Invalid base64 frame data");
        payload = payload.mid(comma + 1);
    }
    if (payload.isEmpty()) throw posture::InputDecodeError("Empty frame data");

    auto decoded = QByteArray::fromBase64Encoding(payload, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) throw posture::InputDecodeError("Invalid base64 frame data");

    return decodeImageBytes(*decoded, min_w, min_h);
}

cv::Mat decodeImageBytes(const QByteArray& bytes, int min_w, int min_h) {
    if (bytes.isEmpty()) throw posture::InputDecodeError("Failed to decode image");

    const std::vector<uchar> buf(bytes.cbegin(), bytes.cend());
    cv::Mat image;
    try {
        image = cv::imdecode(buf, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw posture::InputDecodeError(std::string("Failed to decode image: ") + e.what());
    }
    if (image.empty()) throw posture::InputDecodeError("Failed to decode image");

    if (image.cols < min_w || image.rows < min_h) {
        throw posture::InputDecodeError("Image dimensions too small");
    }
    if (image.channels() != 3) {
        throw posture::InputDecodeError("Invalid image format");
    }
    return image;
}

QByteArray encodeJpegBase64(const cv::Mat& bgr, int quality) {
    std::vector<uchar> buf;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (bgr.empty() || !cv::imencode(".jpg", bgr, buf, params)) return {};
    return QByteArray(reinterpret_cast<const char*>(buf.data()), static_cast<int>(buf.size())).toBase64();
}

} // namespace vision
