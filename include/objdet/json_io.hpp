#pragma once

#include "detection.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace objdet {

// {"detections", "num_detections", "inference_time_ms", "image_dimensions": [w, h], "model_name"}
nlohmann::json toJson(const PredictionResponse& response);
nlohmann::json toJson(const Detection& detection);
nlohmann::json toJson(const HealthStatus& health);

nlohmann::json errorToJson(const std::string& detail);

} // namespace objdet
