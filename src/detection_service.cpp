#include "objdet/detection_service.hpp"
#include "objdet/errors.hpp"
#include "objdet/image_normalizer.hpp"
#include "objdet/result_translator.hpp"

#include <cmath>

namespace objdet {

namespace {

float resolveThreshold(std::optional<float> value, float fallback, const char* name) {
    if (!value) return fallback;
    if (!isValidThreshold(*value)) {
        throw InvalidParameterError(std::string(name) + " must be in [0, 1], got " +
                                    std::to_string(*value));
    }
    return *value;
}

} // namespace

DetectionService::DetectionService(const DetectorHandle& handle, const ServiceConfig& config)
    : handle_(handle)
    , default_conf_(config.model.conf_threshold)
    , default_iou_(config.model.iou_threshold)
    , version_(config.app_version) {}

PredictionResponse DetectionService::predict(const uint8_t* data, size_t size,
                                             std::optional<float> conf_threshold,
                                             std::optional<float> iou_threshold) const {
    if (!handle_.isReady()) {
        throw ServiceUnavailableError("Model not loaded. Service unavailable.");
    }

    const float conf = resolveThreshold(conf_threshold, default_conf_, "confidence_threshold");
    const float iou = resolveThreshold(iou_threshold, default_iou_, "iou_threshold");

    DecodedImage image = ImageNormalizer::decode(data, size);

    // Timed inside the handle: decode, translation and queueing are excluded
    RawResult raw = handle_.infer(image.pixels, conf, iou);

    PredictionResponse response;
    response.detections = ResultTranslator::translate(raw, handle_.labels());
    response.inference_time_ms = std::round(raw.inference_ms * 100.0) / 100.0;
    response.image_dimensions = {image.width, image.height};
    response.model_name = handle_.modelName();
    return response;
}

PredictionResponse DetectionService::predict(const std::vector<uint8_t>& bytes,
                                             std::optional<float> conf_threshold,
                                             std::optional<float> iou_threshold) const {
    return predict(bytes.data(), bytes.size(), conf_threshold, iou_threshold);
}

PredictionResponse DetectionService::predict(const std::string& bytes,
                                             std::optional<float> conf_threshold,
                                             std::optional<float> iou_threshold) const {
    return predict(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(),
                   conf_threshold, iou_threshold);
}

HealthStatus DetectionService::health() const {
    HealthStatus status;
    status.model_loaded = handle_.isReady();
    status.status = status.model_loaded ? "healthy" : "unhealthy";
    status.model_name = handle_.modelName();
    status.version = version_;
    return status;
}

} // namespace objdet
