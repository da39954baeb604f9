#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "objdet/config.hpp"
#include "objdet/errors.hpp"
#include "objdet/json_io.hpp"
#include "objdet/service_runtime.hpp"
#include "objdet/trt_engine.hpp"

#include <memory>
#include <optional>
#include <string>

namespace py = pybind11;
using namespace objdet;

namespace {

// nlohmann::json -> Python objects via the json module keeps the schema in one place (json_io)
py::object toPython(const nlohmann::json& value) {
    return py::module_::import("json").attr("loads")(value.dump());
}

template <typename T>
void registerError(py::module_& m, const char* name, py::handle base, ErrorKind kind) {
    auto& exc = py::register_exception<T>(m, name, base);
    exc.attr("http_status") = httpStatusFor(kind);
}

} // namespace

PYBIND11_MODULE(objdet, m) {
    m.doc() = "Object detection service core";

    // Base first: pybind11 tries the most recently registered translator first
    auto& base = py::register_exception<Error>(m, "Error");
    base.attr("http_status") = httpStatusFor(ErrorKind::Internal);
    registerError<LoadError>(m, "LoadError", base, ErrorKind::Load);
    registerError<NotReadyError>(m, "NotReadyError", base, ErrorKind::NotReady);
    registerError<ServiceUnavailableError>(m, "ServiceUnavailableError", base, ErrorKind::ServiceUnavailable);
    registerError<DecodeError>(m, "DecodeError", base, ErrorKind::Decode);
    registerError<InvalidParameterError>(m, "InvalidParameterError", base, ErrorKind::InvalidParameter);
    registerError<InvalidUploadError>(m, "InvalidUploadError", base, ErrorKind::InvalidUpload);
    registerError<PayloadTooLargeError>(m, "PayloadTooLargeError", base, ErrorKind::PayloadTooLarge);
    registerError<UnknownClassError>(m, "UnknownClassError", base, ErrorKind::UnknownClass);
    registerError<ContractError>(m, "ContractError", base, ErrorKind::Contract);
    registerError<ConfigError>(m, "ConfigError", base, ErrorKind::Config);

    py::class_<ModelConfig>(m, "ModelConfig")
        .def(py::init<>())
        .def_readwrite("model_path", &ModelConfig::model_path)
        .def_readwrite("model_name", &ModelConfig::model_name)
        .def_readwrite("input_width", &ModelConfig::input_width)
        .def_readwrite("input_height", &ModelConfig::input_height)
        .def_readwrite("conf_threshold", &ModelConfig::conf_threshold)
        .def_readwrite("iou_threshold", &ModelConfig::iou_threshold)
        .def_readwrite("max_detections", &ModelConfig::max_detections)
        .def_readwrite("class_names", &ModelConfig::class_names)
        .def("identifier", &ModelConfig::identifier);

    py::class_<UploadLimits>(m, "UploadLimits")
        .def(py::init<>())
        .def_readwrite("max_file_size", &UploadLimits::max_file_size)
        .def_readwrite("allowed_extensions", &UploadLimits::allowed_extensions);

    py::class_<ServiceConfig>(m, "ServiceConfig")
        .def(py::init(&ServiceConfig::defaults))
        .def_static("from_environment", &ServiceConfig::fromEnvironment)
        .def_readwrite("app_name", &ServiceConfig::app_name)
        .def_readwrite("app_version", &ServiceConfig::app_version)
        .def_readwrite("log_level", &ServiceConfig::log_level)
        .def_readwrite("model", &ServiceConfig::model)
        .def_readwrite("upload", &ServiceConfig::upload)
        .def("validate", &ServiceConfig::validate);

    m.def("load_class_names", &loadClassNames, py::arg("path"));

    py::class_<ServiceRuntime>(m, "Runtime")
        .def(py::init([](const ServiceConfig& config) {
            config.validate();
            return std::make_unique<ServiceRuntime>(config, std::make_unique<TrtEngine>());
        }), py::arg("config"))
        .def("start", &ServiceRuntime::start, py::call_guard<py::gil_scoped_release>())
        .def("is_ready", &ServiceRuntime::isReady)
        .def("model_name", [](const ServiceRuntime& self) { return self.handle().modelName(); })
        .def("load_error", [](const ServiceRuntime& self) { return self.handle().loadError(); })
        .def("health", [](const ServiceRuntime& self) {
            return toPython(toJson(self.service().health()));
        })
        .def("info", [](const ServiceRuntime& self) { return toPython(self.infoReply().body); })
        .def("predict", [](const ServiceRuntime& self, const py::bytes& data,
                           std::optional<float> confidence, std::optional<float> iou_threshold) {
            std::string bytes = data;
            nlohmann::json result;
            {
                py::gil_scoped_release release;
                result = toJson(self.service().predict(bytes, confidence, iou_threshold));
            }
            return toPython(result);
        }, py::arg("image"), py::arg("confidence") = py::none(), py::arg("iou_threshold") = py::none())
        .def("handle_upload", [](const ServiceRuntime& self, const std::string& filename,
                                 const std::string& content_type, const py::bytes& data,
                                 std::optional<float> confidence, std::optional<float> iou_threshold) {
            std::string bytes = data;
            Reply reply;
            {
                py::gil_scoped_release release;
                reply = self.handleUpload(filename, content_type, bytes, confidence, iou_threshold);
            }
            return py::make_tuple(reply.status, toPython(reply.body));
        }, py::arg("filename"), py::arg("content_type"), py::arg("image"),
           py::arg("confidence") = py::none(), py::arg("iou_threshold") = py::none());
}
