#pragma once

#include "preprocessor.hpp"
#include "raw_result.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace objdet {

struct DecodeParams {
    float conf_threshold = 0.5f;
    float iou_threshold = 0.45f;
    int max_detections = 300;
};

class Postprocessor {
public:
    // Decodes a YOLOv8 head laid out as [4 + num_classes, num_anchors] (cx, cy, w, h, scores).
    // Keeps candidates whose best class score is >= conf_threshold, maps them back through
    // the letterbox, clips them to the frame and drops sub-pixel slivers, then runs
    // per-class NMS capped at max_detections.
    // Output is ordered by descending score.
    static RawResult process(const float* raw_output,
                             int num_anchors,
                             int num_classes,
                             const DecodeParams& params,
                             const LetterboxInfo& letterbox,
                             int frame_w,
                             int frame_h);

    // Greedy NMS. Only boxes of the same class suppress each other, and only when their
    // IoU is strictly greater than iou_threshold. Returns kept indices, best score first.
    static std::vector<int> nms(const std::vector<cv::Rect2f>& boxes,
                                const std::vector<float>& scores,
                                const std::vector<int>& class_ids,
                                float iou_threshold,
                                int max_keep);

    static float iou(const cv::Rect2f& a, const cv::Rect2f& b);
};

} // namespace objdet
