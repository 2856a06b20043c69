#include <gtest/gtest.h>

#include "posture/errors.hpp"
#include "posture/vision/FrameCodec.h"

#include <opencv2/imgcodecs.hpp>
#include <vector>

using namespace vision;

namespace {

QByteArray encodeBase64(const cv::Mat& img, const char* ext = ".png") {
    std::vector<uchar> buf;
    cv::imencode(ext, img, buf);
    return QByteArray(reinterpret_cast<const char*>(buf.data()), static_cast<int>(buf.size())).toBase64();
}

} // namespace

TEST(FrameCodec, DecodesColorImage) {
    const cv::Mat src(150, 200, CV_8UC3, cv::Scalar(10, 20, 30));
    const cv::Mat out = decodeBase64Frame(encodeBase64(src));
    EXPECT_EQ(out.cols, 200);
    EXPECT_EQ(out.rows, 150);
    EXPECT_EQ(out.channels(), 3);
}

TEST(FrameCodec, AcceptsDataUrlPrefix) {
    const cv::Mat src(120, 120, CV_8UC3, cv::Scalar::all(128));
    const QByteArray payload = "data:image/png;base64," + encodeBase64(src);
    EXPECT_EQ(decodeBase64Frame(payload).cols, 120);
}

TEST(FrameCodec, GrayscaleIsPromotedToThreeChannels) {
    const cv::Mat gray(128, 128, CV_8UC1, cv::Scalar(200));
    EXPECT_EQ(decodeBase64Frame(encodeBase64(gray)).channels(), 3);
}

TEST(FrameCodec, RejectsInvalidBase64) {
    EXPECT_THROW(decodeBase64Frame("not*valid*base64!!"), posture::InputDecodeError);
}

TEST(FrameCodec, RejectsEmptyPayload) {
    EXPECT_THROW(decodeBase64Frame(""), posture::InputDecodeError);
    EXPECT_THROW(decodeBase64Frame("data:image/png;base64,"), posture::InputDecodeError);
}

TEST(FrameCodec, RejectsNonImageBytes) {
    const QByteArray garbage = QByteArray("definitely not an image").toBase64();
    EXPECT_THROW(decodeBase64Frame(garbage), posture::InputDecodeError);
}

TEST(FrameCodec, RejectsTooSmallImage) {
    const cv::Mat tiny(50, 50, CV_8UC3, cv::Scalar::all(0));
    try {
        decodeBase64Frame(encodeBase64(tiny));
        FAIL() << "expected InputDecodeError";
    } catch (const posture::InputDecodeError& e) {
        EXPECT_STREQ(e.what(), "Image dimensions too small");
    }

    // minimum applies per dimension
    const cv::Mat narrow(300, 99, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(decodeBase64Frame(encodeBase64(narrow)), posture::InputDecodeError);
    EXPECT_NO_THROW(decodeBase64Frame(encodeBase64(narrow), 90, 90));
}

TEST(FrameCodec, JpegRoundTripKeepsSize) {
    const cv::Mat src(240, 320, CV_8UC3, cv::Scalar(0, 128, 255));
    const QByteArray b64 = encodeJpegBase64(src, 80);
    ASSERT_FALSE(b64.isEmpty());
    const cv::Mat back = decodeBase64Frame(b64);
    EXPECT_EQ(back.cols, 320);
    EXPECT_EQ(back.rows, 240);
}
