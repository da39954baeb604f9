#include "objdet/preprocessor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace objdet {

LetterboxInfo Preprocessor::letterbox(const cv::Mat& src, cv::Mat& dst,
                                      int target_w, int target_h,
                                      const cv::Scalar& color) {
    LetterboxInfo info;

    info.scale = std::min(static_cast<float>(target_h) / src.rows,
                          static_cast<float>(target_w) / src.cols);

    int new_w = std::max(1, static_cast<int>(src.cols * info.scale));
    int new_h = std::max(1, static_cast<int>(src.rows * info.scale));

    info.pad_x = (target_w - new_w) / 2;
    info.pad_y = (target_h - new_h) / 2;

    dst.create(target_h, target_w, CV_8UC3);
    dst.setTo(color);

    cv::Mat roi = dst(cv::Rect(info.pad_x, info.pad_y, new_w, new_h));
    if (new_w == src.cols && new_h == src.rows) {
        src.copyTo(roi);
    } else {
        cv::resize(src, roi, roi.size(), 0, 0, cv::INTER_LINEAR);
    }

    return info;
}

LetterboxInfo Preprocessor::process(const cv::Mat& src, std::vector<float>& dst,
                                    int target_w, int target_h) {
    thread_local cv::Mat letterboxed;
    LetterboxInfo info = letterbox(src, letterboxed, target_w, target_h);

    thread_local cv::Mat rgb;
    cv::cvtColor(letterboxed, rgb, cv::COLOR_BGR2RGB);

    thread_local cv::Mat normalized;
    rgb.convertTo(normalized, CV_32FC3, 1.0 / 255.0);

    // Split straight into the CHW planes of dst
    const size_t hw = static_cast<size_t>(target_w) * target_h;
    dst.resize(hw * 3);
    std::vector<cv::Mat> planes = {
        cv::Mat(target_h, target_w, CV_32FC1, dst.data()),
        cv::Mat(target_h, target_w, CV_32FC1, dst.data() + hw),
        cv::Mat(target_h, target_w, CV_32FC1, dst.data() + hw * 2)
    };
    cv::split(normalized, planes);

    return info;
}

} // namespace objdet
