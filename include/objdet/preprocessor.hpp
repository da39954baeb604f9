#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace objdet {

struct LetterboxInfo {
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;

    // Network-input coordinates back to the source image
    float toSourceX(float x) const { return (x - pad_x) / scale; }
    float toSourceY(float y) const { return (y - pad_y) / scale; }
};

class Preprocessor {
public:
    // Letterbox resize: preserves aspect ratio, pads with gray
    static LetterboxInfo letterbox(const cv::Mat& src, cv::Mat& dst,
                                   int target_w, int target_h,
                                   const cv::Scalar& color = cv::Scalar(114, 114, 114));

    // letterbox + BGR2RGB + [0, 1] scaling + HWC2CHW into dst (3 * target_w * target_h floats)
    static LetterboxInfo process(const cv::Mat& src, std::vector<float>& dst,
                                 int target_w, int target_h);
};

} // namespace objdet
