#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace objdet {

struct DecodedImage {
    cv::Mat pixels;  // CV_8UC3, BGR
    int width = 0;
    int height = 0;
};

class ImageNormalizer {
public:
    // Decodes any imgcodecs-readable encoding into 3-channel BGR. Grayscale is expanded,
    // alpha dropped, EXIF orientation ignored. Throws DecodeError.
    static DecodedImage decode(const std::vector<uint8_t>& bytes);
    static DecodedImage decode(const uint8_t* data, size_t size);
    static DecodedImage decode(const std::string& bytes);
};

} // namespace objdet
