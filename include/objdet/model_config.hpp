#pragma once

#include <string>
#include <vector>

namespace objdet {

struct ModelConfig {
    std::string model_path;
    std::string model_name;
    int input_width = 640;
    int input_height = 640;
    float conf_threshold = 0.5f;
    float iou_threshold = 0.45f;
    int max_detections = 300;
    std::vector<std::string> class_names;

    ModelConfig() = default;

    ModelConfig(const std::string& path,
                const std::vector<std::string>& classes,
                float conf = 0.5f,
                float iou = 0.45f,
                int width = 640,
                int height = 640)
        : model_path(path)
        , input_width(width)
        , input_height(height)
        , conf_threshold(conf)
        , iou_threshold(iou)
        , class_names(classes) {}

    // model_name when set, else the file name of model_path
    std::string identifier() const;
};

} // namespace objdet
