#include "objdet/errors.hpp"
#include "objdet/image_normalizer.hpp"
#include "fake_backend.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <limits>

using namespace objdet;
using objdet::testing::encodeImage;

TEST(ImageNormalizerTest, DecodesColorPng) {
    cv::Mat img(48, 64, CV_8UC3, cv::Scalar(10, 20, 30));
    DecodedImage decoded = ImageNormalizer::decode(encodeImage(img));

    EXPECT_EQ(decoded.width, 64);
    EXPECT_EQ(decoded.height, 48);
    EXPECT_EQ(decoded.pixels.type(), CV_8UC3);
    cv::Vec3b px = decoded.pixels.at<cv::Vec3b>(5, 5);
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[1], 20);
    EXPECT_EQ(px[2], 30);
}

TEST(ImageNormalizerTest, ExpandsGrayscaleToThreeChannels) {
    cv::Mat gray(30, 40, CV_8UC1, cv::Scalar(77));
    DecodedImage decoded = ImageNormalizer::decode(encodeImage(gray));

    EXPECT_EQ(decoded.pixels.type(), CV_8UC3);
    EXPECT_EQ(decoded.width, 40);
    EXPECT_EQ(decoded.height, 30);
    cv::Vec3b px = decoded.pixels.at<cv::Vec3b>(0, 0);
    EXPECT_EQ(px[0], 77);
    EXPECT_EQ(px[1], 77);
    EXPECT_EQ(px[2], 77);
}

TEST(ImageNormalizerTest, DropsAlphaChannel) {
    cv::Mat rgba(20, 25, CV_8UC4, cv::Scalar(1, 2, 3, 0));
    DecodedImage decoded = ImageNormalizer::decode(encodeImage(rgba));

    EXPECT_EQ(decoded.pixels.channels(), 3);
    EXPECT_EQ(decoded.width, 25);
    EXPECT_EQ(decoded.height, 20);
}

TEST(ImageNormalizerTest, DecodesJpeg) {
    cv::Mat img(100, 150, CV_8UC3, cv::Scalar(200, 100, 50));
    DecodedImage decoded = ImageNormalizer::decode(encodeImage(img, ".jpg"));

    EXPECT_EQ(decoded.width, 150);
    EXPECT_EQ(decoded.height, 100);
}

TEST(ImageNormalizerTest, RejectsTextBytes) {
    EXPECT_THROW(ImageNormalizer::decode(std::string("not an image")), DecodeError);
}

TEST(ImageNormalizerTest, RejectsEmptyInput) {
    EXPECT_THROW(ImageNormalizer::decode(std::vector<uint8_t>{}), DecodeError);
}

TEST(ImageNormalizerTest, RejectsTruncatedPng) {
    cv::Mat img(64, 64, CV_8UC3, cv::Scalar(0, 255, 0));
    std::string bytes = encodeImage(img);
    EXPECT_THROW(ImageNormalizer::decode(bytes.substr(0, 16)), DecodeError);
}

TEST(ImageNormalizerTest, RejectsSizeBeyondIntRange) {
    // The length is checked before the buffer is touched
    const uint8_t byte = 0;
    size_t size = static_cast<size_t>(std::numeric_limits<int>::max()) + 1;
    EXPECT_THROW(ImageNormalizer::decode(&byte, size), DecodeError);
}
