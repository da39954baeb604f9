#pragma once

#include "inference_backend.hpp"
#include "model_config.hpp"
#include "raw_result.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace objdet {

// Sole owner of the loaded model. Shared by const reference across request threads.
//
// Lifecycle: Unloaded -> Loading -> Ready | Failed, one transition out of Unloaded per
// handle. Construction does no I/O; load() is the only fallible step.
class DetectorHandle {
public:
    enum class State { Unloaded, Loading, Ready, Failed };

    DetectorHandle(ModelConfig config, InferenceBackendPtr backend);
    ~DetectorHandle();

    DetectorHandle(const DetectorHandle&) = delete;
    DetectorHandle& operator=(const DetectorHandle&) = delete;

    // No-op once Ready. Throws LoadError on failure and on every later call after a failure.
    void load();

    bool isReady() const { return state_.load() == State::Ready; }
    State state() const { return state_.load(); }

    // Cause of the failed load, empty otherwise
    std::string loadError() const;

    std::string modelName() const { return config_.identifier(); }
    const std::vector<std::string>& labels() const { return config_.class_names; }
    const ModelConfig& config() const { return config_; }

    // Forward pass + NMS. Throws NotReadyError outside Ready and InvalidParameterError
    // for thresholds outside [0, 1] or an image that is not 8-bit 3-channel.
    // The result's inference_ms excludes time spent waiting for another caller.
    RawResult infer(const cv::Mat& image, float conf_threshold, float iou_threshold) const;

private:
    void fail(const std::string& cause);

    ModelConfig config_;
    InferenceBackendPtr backend_;

    std::atomic<State> state_{State::Unloaded};
    std::mutex load_mutex_;

    mutable std::mutex error_mutex_;
    std::string load_error_;

    // The engine's execution context and device buffers are single-stream
    mutable std::mutex infer_mutex_;
};

const char* stateName(DetectorHandle::State state);

} // namespace objdet
