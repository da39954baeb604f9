#include "objdet/detector_handle.hpp"
#include "objdet/config.hpp"
#include "objdet/errors.hpp"
#include "objdet/logger.hpp"

#include <chrono>

namespace objdet {

DetectorHandle::DetectorHandle(ModelConfig config, InferenceBackendPtr backend)
    : config_(std::move(config)), backend_(std::move(backend)) {}

DetectorHandle::~DetectorHandle() = default;

void DetectorHandle::load() {
    std::lock_guard<std::mutex> lock(load_mutex_);

    State current = state_.load();
    if (current == State::Ready) return;
    if (current == State::Failed) throw LoadError(loadError());

    state_ = State::Loading;
    logInfo("Loading model: " + config_.identifier() + " (" + config_.model_path + ")");

    if (!backend_) {
        fail("No inference backend configured");
        throw LoadError(loadError());
    }

    auto start = std::chrono::steady_clock::now();
    try {
        backend_->load(config_);
    } catch (const LoadError& e) {
        fail(e.what());
        throw;
    } catch (const std::exception& e) {
        fail(e.what());
        throw LoadError(e.what());
    }
    auto end = std::chrono::steady_clock::now();

    state_ = State::Ready;
    logInfo("Model loaded: " + config_.identifier() + " in " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count()) +
            " ms, " + std::to_string(config_.class_names.size()) + " classes");
}

void DetectorHandle::fail(const std::string& cause) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        load_error_ = cause;
    }
    state_ = State::Failed;
    logError("Failed to load model " + config_.identifier() + ": " + cause);
}

std::string DetectorHandle::loadError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return load_error_;
}

RawResult DetectorHandle::infer(const cv::Mat& image, float conf_threshold,
                                float iou_threshold) const {
    State current = state_.load();
    if (current != State::Ready) {
        throw NotReadyError(std::string("Model is not ready (state: ") + stateName(current) + ")");
    }
    if (!isValidThreshold(conf_threshold)) {
        throw InvalidParameterError("Confidence threshold must be in [0, 1], got " +
                                    std::to_string(conf_threshold));
    }
    if (!isValidThreshold(iou_threshold)) {
        throw InvalidParameterError("IoU threshold must be in [0, 1], got " +
                                    std::to_string(iou_threshold));
    }
    if (image.empty() || image.type() != CV_8UC3) {
        throw InvalidParameterError("Detector expects a non-empty 8-bit 3-channel image");
    }

    std::lock_guard<std::mutex> lock(infer_mutex_);
    auto start = std::chrono::steady_clock::now();
    RawResult raw = backend_->infer(image, conf_threshold, iou_threshold);
    auto end = std::chrono::steady_clock::now();

    raw.inference_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return raw;
}

const char* stateName(DetectorHandle::State state) {
    switch (state) {
        case DetectorHandle::State::Unloaded: return "unloaded";
        case DetectorHandle::State::Loading:  return "loading";
        case DetectorHandle::State::Ready:    return "ready";
        case DetectorHandle::State::Failed:   return "failed";
    }
    return "unloaded";
}

} // namespace objdet
