#include "objdet/image_normalizer.hpp"
#include "objdet/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <limits>

namespace objdet {

DecodedImage ImageNormalizer::decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw DecodeError("Empty image data");
    }
    // cv::Mat dimensions are int
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DecodeError("Image data too large to decode: " + std::to_string(size) + " bytes");
    }

    // imdecode only reads the buffer; the const_cast never leads to a write
    const cv::Mat buf(1, static_cast<int>(size), CV_8UC1, const_cast<uint8_t*>(data));

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(buf, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Cannot decode image: ") + e.what());
    }

    if (decoded.empty()) {
        throw DecodeError("Cannot decode image: unsupported or malformed data");
    }

    DecodedImage image;
    if (decoded.channels() == 3) {
        image.pixels = decoded;
    } else if (decoded.channels() == 1) {
        cv::cvtColor(decoded, image.pixels, cv::COLOR_GRAY2BGR);
    } else if (decoded.channels() == 4) {
        cv::cvtColor(decoded, image.pixels, cv::COLOR_BGRA2BGR);
    } else {
        throw DecodeError("Unsupported channel layout: " + std::to_string(decoded.channels()));
    }

    if (image.pixels.depth() != CV_8U) {
        image.pixels.convertTo(image.pixels, CV_8U);
    }

    image.width = image.pixels.cols;
    image.height = image.pixels.rows;
    return image;
}

DecodedImage ImageNormalizer::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

DecodedImage ImageNormalizer::decode(const std::string& bytes) {
    return decode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

} // namespace objdet
