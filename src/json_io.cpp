#include "objdet/json_io.hpp"

namespace objdet {

nlohmann::json toJson(const Detection& detection) {
    return nlohmann::json{
        {"class_name", detection.class_name},
        {"confidence", detection.confidence},
        {"bbox", {
            {"x_min", detection.bbox.x_min},
            {"y_min", detection.bbox.y_min},
            {"x_max", detection.bbox.x_max},
            {"y_max", detection.bbox.y_max}
        }}
    };
}

nlohmann::json toJson(const PredictionResponse& response) {
    nlohmann::json detections = nlohmann::json::array();
    for (const auto& det : response.detections) {
        detections.push_back(toJson(det));
    }

    return nlohmann::json{
        {"detections", detections},
        {"num_detections", response.numDetections()},
        {"inference_time_ms", response.inference_time_ms},
        {"image_dimensions", {response.image_dimensions.width, response.image_dimensions.height}},
        {"model_name", response.model_name}
    };
}

nlohmann::json toJson(const HealthStatus& health) {
    return nlohmann::json{
        {"status", health.status},
        {"model_loaded", health.model_loaded},
        {"model_name", health.model_name},
        {"version", health.version}
    };
}

nlohmann::json errorToJson(const std::string& detail) {
    return nlohmann::json{{"detail", detail}};
}

} // namespace objdet
