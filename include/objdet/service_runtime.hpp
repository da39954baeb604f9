#pragma once

#include "config.hpp"
#include "detection_service.hpp"
#include "detector_handle.hpp"
#include "inference_backend.hpp"
#include "upload_gate.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace objdet {

struct Reply {
    int status = 200;
    nlohmann::json body;
};

// Composition root: owns the handle, the service on top of it and the upload gate.
// Hosts (CLI, Python module) build one of these at startup and share it.
class ServiceRuntime {
public:
    ServiceRuntime(ServiceConfig config, InferenceBackendPtr backend);

    ServiceRuntime(const ServiceRuntime&) = delete;
    ServiceRuntime& operator=(const ServiceRuntime&) = delete;

    // One-time model load. A failure is logged and leaves the runtime up but unhealthy.
    bool start();

    bool isReady() const { return handle_.isReady(); }

    Reply handleUpload(const std::string& filename,
                       const std::string& content_type,
                       const std::string& bytes,
                       std::optional<float> conf_threshold = std::nullopt,
                       std::optional<float> iou_threshold = std::nullopt) const;

    Reply healthReply() const;
    Reply infoReply() const;

    const ServiceConfig& config() const { return config_; }
    const DetectorHandle& handle() const { return handle_; }
    const DetectionService& service() const { return service_; }
    const UploadGate& gate() const { return gate_; }

private:
    ServiceConfig config_;
    DetectorHandle handle_;
    DetectionService service_;
    UploadGate gate_;
};

} // namespace objdet
