#pragma once

#include "model_config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace objdet {

struct UploadLimits {
    size_t max_file_size = 10000000;
    std::vector<std::string> allowed_extensions{"jpg", "jpeg", "png", "bmp", "webp"};
};

struct ServiceConfig {
    std::string app_name = "Object Detection API";
    std::string app_version = "1.0.0";
    std::string log_level = "info";
    ModelConfig model;
    UploadLimits upload;

    // Built-in defaults: yolov8n engine, COCO labels
    static ServiceConfig defaults();

    // Defaults overridden by MODEL_PATH, MODEL_NAME, LABELS_PATH, CONFIDENCE_THRESHOLD,
    // IOU_THRESHOLD, MAX_DETECTIONS, INPUT_WIDTH, INPUT_HEIGHT, MAX_FILE_SIZE,
    // ALLOWED_EXTENSIONS (comma separated) and LOG_LEVEL
    static ServiceConfig fromEnvironment();

    // Throws ConfigError on the first invalid value
    void validate() const;
};

std::optional<std::string> getEnvVar(const std::string& key);

// One class name per line, blank lines skipped. Throws ConfigError.
std::vector<std::string> loadClassNames(const std::string& path);

const std::vector<std::string>& cocoClassNames();

bool isValidThreshold(float value);

} // namespace objdet
