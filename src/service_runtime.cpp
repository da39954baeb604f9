#include "objdet/service_runtime.hpp"
#include "objdet/errors.hpp"
#include "objdet/json_io.hpp"
#include "objdet/logger.hpp"

#include <iomanip>
#include <sstream>

namespace objdet {

ServiceRuntime::ServiceRuntime(ServiceConfig config, InferenceBackendPtr backend)
    : config_(std::move(config))
    , handle_(config_.model, std::move(backend))
    , service_(handle_, config_)
    , gate_(config_.upload) {}

bool ServiceRuntime::start() {
    Logger::instance().setMinSeverity(parseSeverity(config_.log_level));
    logInfo("Starting " + config_.app_name + " " + config_.app_version);

    try {
        handle_.load();
    } catch (const LoadError& e) {
        logError("Model failed to load, service will report unhealthy: " + std::string(e.what()));
        return false;
    }

    std::ostringstream defaults;
    defaults << std::fixed << std::setprecision(2)
             << "confidence=" << service_.defaultConfThreshold()
             << " iou=" << service_.defaultIouThreshold();
    logInfo("Ready: model " + handle_.modelName() + ", " + defaults.str());
    return true;
}

Reply ServiceRuntime::handleUpload(const std::string& filename,
                                   const std::string& content_type,
                                   const std::string& bytes,
                                   std::optional<float> conf_threshold,
                                   std::optional<float> iou_threshold) const {
    try {
        if (!handle_.isReady()) {
            logError("Prediction attempted but model not loaded");
            throw ServiceUnavailableError("Model not loaded. Service unavailable.");
        }

        gate_.check(filename, content_type, bytes.size());
        logInfo("Processing image: " + filename + " (" + std::to_string(bytes.size()) + " bytes)");

        PredictionResponse response = service_.predict(bytes, conf_threshold, iou_threshold);

        std::ostringstream msg;
        msg << "Detection complete: " << response.numDetections() << " objects found in "
            << std::fixed << std::setprecision(2) << response.inference_time_ms << "ms";
        logInfo(msg.str());

        return Reply{200, toJson(response)};
    } catch (const Error& e) {
        int status = e.httpStatus();
        if (status >= 500 && status != 503) {
            logError(std::string("Prediction failed (") + errorKindName(e.kind()) + "): " + e.what());
            return Reply{status, errorToJson(std::string("Prediction failed: ") + e.what())};
        }
        logWarning(std::string("Rejected request (") + errorKindName(e.kind()) + "): " + e.what());
        return Reply{status, errorToJson(e.what())};
    } catch (const std::exception& e) {
        logError(std::string("Unhandled exception: ") + e.what());
        return Reply{500, errorToJson("Internal server error")};
    }
}

Reply ServiceRuntime::healthReply() const {
    return Reply{200, toJson(service_.health())};
}

Reply ServiceRuntime::infoReply() const {
    return Reply{200, nlohmann::json{
        {"message", config_.app_name},
        {"version", config_.app_version},
        {"endpoints", {
            {"health", "GET /health - Check API status"},
            {"predict", "POST /predict - Detect objects in an image"}
        }}
    }};
}

} // namespace objdet
