#include "objdet/config.hpp"
#include "objdet/errors.hpp"
#include "objdet/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace objdet {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

float parseFloat(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        float v = std::stof(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(key + " must be a number, got '" + value + "'");
    }
}

long long parseInt(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(key + " must be an integer, got '" + value + "'");
    }
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // namespace

std::string ModelConfig::identifier() const {
    if (!model_name.empty()) return model_name;
    auto slash = model_path.find_last_of("/\\");
    return slash == std::string::npos ? model_path : model_path.substr(slash + 1);
}

bool isValidThreshold(float value) {
    // NaN fails both comparisons
    return value >= 0.0f && value <= 1.0f;
}

std::optional<std::string> getEnvVar(const std::string& key) {
    if (const char* val = std::getenv(key.c_str()))
        return std::string(val);
    return std::nullopt;
}

std::vector<std::string> loadClassNames(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("Failed to open labels file: " + path);
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (!line.empty()) names.push_back(line);
    }

    if (names.empty()) {
        throw ConfigError("Labels file is empty: " + path);
    }
    return names;
}

ServiceConfig ServiceConfig::defaults() {
    ServiceConfig config;
    config.model.model_path = "yolov8n.engine";
    config.model.class_names = cocoClassNames();
    return config;
}

ServiceConfig ServiceConfig::fromEnvironment() {
    ServiceConfig config = defaults();

    if (auto v = getEnvVar("MODEL_PATH")) config.model.model_path = *v;
    if (auto v = getEnvVar("MODEL_NAME")) config.model.model_name = *v;
    if (auto v = getEnvVar("LABELS_PATH")) config.model.class_names = loadClassNames(*v);
    if (auto v = getEnvVar("CONFIDENCE_THRESHOLD"))
        config.model.conf_threshold = parseFloat("CONFIDENCE_THRESHOLD", *v);
    if (auto v = getEnvVar("IOU_THRESHOLD"))
        config.model.iou_threshold = parseFloat("IOU_THRESHOLD", *v);
    if (auto v = getEnvVar("MAX_DETECTIONS"))
        config.model.max_detections = static_cast<int>(parseInt("MAX_DETECTIONS", *v));
    if (auto v = getEnvVar("INPUT_WIDTH"))
        config.model.input_width = static_cast<int>(parseInt("INPUT_WIDTH", *v));
    if (auto v = getEnvVar("INPUT_HEIGHT"))
        config.model.input_height = static_cast<int>(parseInt("INPUT_HEIGHT", *v));
    if (auto v = getEnvVar("MAX_FILE_SIZE")) {
        long long size = parseInt("MAX_FILE_SIZE", *v);
        if (size <= 0) throw ConfigError("MAX_FILE_SIZE must be positive");
        config.upload.max_file_size = static_cast<size_t>(size);
    }
    if (auto v = getEnvVar("ALLOWED_EXTENSIONS"))
        config.upload.allowed_extensions = splitList(*v);
    if (auto v = getEnvVar("LOG_LEVEL")) config.log_level = *v;

    config.validate();
    return config;
}

void ServiceConfig::validate() const {
    if (model.model_path.empty())
        throw ConfigError("Model path is empty");
    if (model.class_names.empty())
        throw ConfigError("Label table is empty");
    for (size_t i = 0; i < model.class_names.size(); ++i) {
        if (model.class_names[i].empty())
            throw ConfigError("Label " + std::to_string(i) + " is empty");
    }
    if (!isValidThreshold(model.conf_threshold))
        throw ConfigError("Default confidence threshold must be in [0, 1], got " +
                          std::to_string(model.conf_threshold));
    if (!isValidThreshold(model.iou_threshold))
        throw ConfigError("Default IoU threshold must be in [0, 1], got " +
                          std::to_string(model.iou_threshold));
    if (model.input_width <= 0 || model.input_height <= 0)
        throw ConfigError("Model input size must be positive");
    if (model.max_detections <= 0)
        throw ConfigError("MAX_DETECTIONS must be positive");
    if (upload.max_file_size == 0)
        throw ConfigError("Max file size must be positive");
    if (upload.allowed_extensions.empty())
        throw ConfigError("No allowed file extensions configured");

    parseSeverity(log_level);
}

const std::vector<std::string>& cocoClassNames() {
    static const std::vector<std::string> names = {
        "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck", "boat",
        "traffic light", "fire hydrant", "stop sign", "parking meter", "bench", "bird", "cat",
        "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe", "backpack",
        "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard", "sports ball",
        "kite", "baseball bat", "baseball glove", "skateboard", "surfboard", "tennis racket",
        "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl", "banana", "apple",
        "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza", "donut", "cake",
        "chair", "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop",
        "mouse", "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
        "refrigerator", "book", "clock", "vase", "scissors", "teddy bear", "hair drier",
        "toothbrush"};
    return names;
}

} // namespace objdet
