#include "objdet/result_translator.hpp"
#include "objdet/errors.hpp"

#include <cmath>

namespace objdet {

namespace {

int truncateCoord(float v, size_t idx) {
    if (!std::isfinite(v)) {
        throw ContractError("Detection " + std::to_string(idx) + " has a non-finite coordinate");
    }
    return static_cast<int>(v);
}

} // namespace

std::vector<Detection> ResultTranslator::translate(const RawResult& raw,
                                                   const std::vector<std::string>& label_table) {
    const size_t n = raw.boxes.size();
    if (raw.scores.size() != n || raw.class_ids.size() != n) {
        throw ContractError("Detector returned " + std::to_string(n) + " boxes, " +
                            std::to_string(raw.scores.size()) + " scores and " +
                            std::to_string(raw.class_ids.size()) + " class ids");
    }

    std::vector<Detection> detections;
    detections.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        int cls = raw.class_ids[i];
        if (cls < 0 || cls >= static_cast<int>(label_table.size())) {
            throw UnknownClassError("Class index " + std::to_string(cls) +
                                    " is outside the label table (" +
                                    std::to_string(label_table.size()) + " classes)");
        }

        float conf = raw.scores[i];
        if (!(conf >= 0.0f && conf <= 1.0f)) {
            throw ContractError("Detection " + std::to_string(i) + " has confidence " +
                                std::to_string(conf) + " outside [0, 1]");
        }

        const auto& b = raw.boxes[i];
        BoundingBox bbox(truncateCoord(b[0], i), truncateCoord(b[1], i),
                         truncateCoord(b[2], i), truncateCoord(b[3], i));
        if (bbox.x_min >= bbox.x_max || bbox.y_min >= bbox.y_max) {
            throw ContractError("Detection " + std::to_string(i) + " has an empty box [" +
                                std::to_string(bbox.x_min) + ", " + std::to_string(bbox.y_min) +
                                ", " + std::to_string(bbox.x_max) + ", " +
                                std::to_string(bbox.y_max) + "]");
        }

        detections.emplace_back(label_table[cls], conf, bbox);
    }

    return detections;
}

} // namespace objdet
