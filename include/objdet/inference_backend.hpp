#pragma once

#include "model_config.hpp"
#include "raw_result.hpp"

#include <opencv2/core.hpp>

#include <memory>

namespace objdet {

// Opaque detection capability: image + thresholds in, NMS-filtered candidates out.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    // Materializes the weights named by config. Throws LoadError.
    virtual void load(const ModelConfig& config) = 0;

    // bgr is CV_8UC3 at original resolution; boxes come back in its pixel space
    virtual RawResult infer(const cv::Mat& bgr, float conf_threshold, float iou_threshold) = 0;

    virtual int inputWidth() const = 0;
    virtual int inputHeight() const = 0;
};

using InferenceBackendPtr = std::unique_ptr<InferenceBackend>;

} // namespace objdet
