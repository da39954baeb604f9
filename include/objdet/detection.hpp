#pragma once

#include <string>
#include <vector>

namespace objdet {

// Pixel coordinates of the original image, top-left origin
struct BoundingBox {
    int x_min = 0;
    int y_min = 0;
    int x_max = 0;
    int y_max = 0;

    BoundingBox() = default;

    BoundingBox(int x1, int y1, int x2, int y2)
        : x_min(x1), y_min(y1), x_max(x2), y_max(y2) {}

    int width() const { return x_max - x_min; }
    int height() const { return y_max - y_min; }
};

struct Detection {
    std::string class_name;
    float confidence = 0.0f;
    BoundingBox bbox;

    Detection() = default;

    Detection(const std::string& name, float conf, const BoundingBox& box)
        : class_name(name), confidence(conf), bbox(box) {}
};

struct ImageDimensions {
    int width = 0;
    int height = 0;
};

struct PredictionResponse {
    std::vector<Detection> detections;
    double inference_time_ms = 0.0;
    ImageDimensions image_dimensions;
    std::string model_name;

    // Derived from detections; there is no separate counter to drift out of sync
    size_t numDetections() const { return detections.size(); }
};

struct HealthStatus {
    std::string status;
    bool model_loaded = false;
    std::string model_name;
    std::string version;
};

} // namespace objdet
