#include "objdet/postprocessor.hpp"

#include <algorithm>
#include <numeric>

namespace objdet {

float Postprocessor::iou(const cv::Rect2f& a, const cv::Rect2f& b) {
    float x1 = std::max(a.x, b.x);
    float y1 = std::max(a.y, b.y);
    float x2 = std::min(a.x + a.width, b.x + b.width);
    float y2 = std::min(a.y + a.height, b.y + b.height);

    float inter_area = std::max(0.0f, x2 - x1) * std::max(0.0f, y2 - y1);
    float union_area = a.area() + b.area() - inter_area;

    return union_area > 0.0f ? inter_area / union_area : 0.0f;
}

std::vector<int> Postprocessor::nms(const std::vector<cv::Rect2f>& boxes,
                                    const std::vector<float>& scores,
                                    const std::vector<int>& class_ids,
                                    float iou_threshold,
                                    int max_keep) {
    std::vector<int> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    // stable so equal scores keep decode order
    std::stable_sort(order.begin(), order.end(), [&scores](int a, int b) {
        return scores[a] > scores[b];
    });

    std::vector<int> keep;
    std::vector<bool> suppressed(order.size(), false);

    for (size_t i = 0; i < order.size(); ++i) {
        if (max_keep > 0 && static_cast<int>(keep.size()) >= max_keep) break;

        int idx = order[i];
        if (suppressed[idx]) continue;

        keep.push_back(idx);

        for (size_t j = i + 1; j < order.size(); ++j) {
            int other = order[j];
            if (suppressed[other] || class_ids[other] != class_ids[idx]) continue;

            if (iou(boxes[idx], boxes[other]) > iou_threshold) {
                suppressed[other] = true;
            }
        }
    }

    return keep;
}

RawResult Postprocessor::process(const float* raw_output,
                                 int num_anchors,
                                 int num_classes,
                                 const DecodeParams& params,
                                 const LetterboxInfo& letterbox,
                                 int frame_w,
                                 int frame_h) {
    const float max_x = static_cast<float>(frame_w);
    const float max_y = static_cast<float>(frame_h);

    std::vector<cv::Rect2f> boxes;
    std::vector<float> scores;
    std::vector<int> class_ids;

    for (int i = 0; i < num_anchors; ++i) {
        float max_score = -1.0f;
        int max_class = 0;
        for (int c = 0; c < num_classes; ++c) {
            float score = raw_output[(4 + c) * num_anchors + i];
            if (score > max_score) {
                max_score = score;
                max_class = c;
            }
        }

        if (max_score < params.conf_threshold) continue;

        float cx = raw_output[0 * num_anchors + i];
        float cy = raw_output[1 * num_anchors + i];
        float bw = raw_output[2 * num_anchors + i];
        float bh = raw_output[3 * num_anchors + i];

        float x1 = std::clamp(letterbox.toSourceX(cx - bw / 2), 0.0f, max_x);
        float y1 = std::clamp(letterbox.toSourceY(cy - bh / 2), 0.0f, max_y);
        float x2 = std::clamp(letterbox.toSourceX(cx + bw / 2), 0.0f, max_x);
        float y2 = std::clamp(letterbox.toSourceY(cy + bh / 2), 0.0f, max_y);

        // Less than a pixel wide after clipping: nothing left to report
        if (x2 - x1 < 1.0f || y2 - y1 < 1.0f) continue;

        boxes.emplace_back(x1, y1, x2 - x1, y2 - y1);
        scores.push_back(max_score);
        class_ids.push_back(max_class);
    }

    std::vector<int> keep = nms(boxes, scores, class_ids,
                                params.iou_threshold, params.max_detections);

    RawResult result;
    for (int idx : keep) {
        const cv::Rect2f& b = boxes[idx];
        result.add(b.x, b.y, b.x + b.width, b.y + b.height, scores[idx], class_ids[idx]);
    }

    return result;
}

} // namespace objdet
