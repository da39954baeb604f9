#pragma once

#include "config.hpp"
#include "detection.hpp"
#include "detector_handle.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace objdet {

class DetectionService {
public:
    DetectionService(const DetectorHandle& handle, const ServiceConfig& config);

    // decode -> infer (timed) -> translate. Threshold overrides fall back to the
    // configured defaults when omitted.
    //
    // Throws ServiceUnavailableError while the handle is not Ready, InvalidParameterError
    // for overrides outside [0, 1], DecodeError for unreadable bytes, and UnknownClassError
    // or ContractError when the detector output does not fit its label table.
    PredictionResponse predict(const uint8_t* data, size_t size,
                               std::optional<float> conf_threshold = std::nullopt,
                               std::optional<float> iou_threshold = std::nullopt) const;

    PredictionResponse predict(const std::vector<uint8_t>& bytes,
                               std::optional<float> conf_threshold = std::nullopt,
                               std::optional<float> iou_threshold = std::nullopt) const;

    PredictionResponse predict(const std::string& bytes,
                               std::optional<float> conf_threshold = std::nullopt,
                               std::optional<float> iou_threshold = std::nullopt) const;

    bool isReady() const { return handle_.isReady(); }
    HealthStatus health() const;

    float defaultConfThreshold() const { return default_conf_; }
    float defaultIouThreshold() const { return default_iou_; }

private:
    const DetectorHandle& handle_;
    float default_conf_;
    float default_iou_;
    std::string version_;
};

} // namespace objdet
