#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace objdet {

// Detector output before translation. Parallel arrays, one entry per kept candidate;
// boxes are x1, y1, x2, y2 in original image pixels.
struct RawResult {
    std::vector<std::array<float, 4>> boxes;
    std::vector<float> scores;
    std::vector<int> class_ids;

    // Wall-clock time of the backend call alone, set by DetectorHandle
    double inference_ms = 0.0;

    size_t size() const { return boxes.size(); }
    bool empty() const { return boxes.empty(); }

    void add(float x1, float y1, float x2, float y2, float score, int class_id) {
        boxes.push_back({x1, y1, x2, y2});
        scores.push_back(score);
        class_ids.push_back(class_id);
    }
};

} // namespace objdet
