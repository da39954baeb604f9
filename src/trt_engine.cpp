#include "objdet/trt_engine.hpp"
#include "objdet/errors.hpp"
#include "objdet/logger.hpp"

#include <fstream>

namespace objdet {

namespace {

class TrtLogger : public nvinfer1::ILogger {
public:
    void log(Severity severity, const char* msg) noexcept override {
        if (severity == Severity::kINTERNAL_ERROR) {
            Logger::instance().log(objdet::Severity::kERROR, std::string("[TRT] ") + msg);
            return;
        }
        Logger::instance().log(static_cast<objdet::Severity>(severity), std::string("[TRT] ") + msg);
    }
} gTrtLogger;

void checkCuda(cudaError_t status, const char* what) {
    if (status != cudaSuccess) {
        throw Error(std::string(what) + ": " + cudaGetErrorString(status));
    }
}

std::vector<char> readEngineFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.good()) {
        throw LoadError("Failed to open engine: " + path);
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        throw LoadError("Engine file is empty: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        throw LoadError("Failed to read engine: " + path);
    }
    return buffer;
}

size_t volume(const nvinfer1::Dims& dims) {
    size_t size = 1;
    for (int d = 0; d < dims.nbDims; ++d) size *= static_cast<size_t>(dims.d[d]);
    return size;
}

} // namespace

TrtEngine::TrtEngine() = default;

TrtEngine::~TrtEngine() {
    release();
}

void TrtEngine::release() {
    if (h_output_) { cudaFreeHost(h_output_); h_output_ = nullptr; }
    if (d_input_) { cudaFree(d_input_); d_input_ = nullptr; }
    if (d_output_) { cudaFree(d_output_); d_output_ = nullptr; }
    if (stream_) { cudaStreamDestroy(stream_); stream_ = nullptr; }
    delete context_;
    context_ = nullptr;
    delete engine_;
    engine_ = nullptr;
    delete runtime_;
    runtime_ = nullptr;
}

void TrtEngine::load(const ModelConfig& config) {
    if (isLoaded()) return;
    config_ = config;

    std::vector<char> buffer = readEngineFile(config.model_path);

    try {
        runtime_ = nvinfer1::createInferRuntime(gTrtLogger);
        if (!runtime_) throw LoadError("Failed to create TensorRT runtime");

        engine_ = runtime_->deserializeCudaEngine(buffer.data(), buffer.size());
        if (!engine_) throw LoadError("Failed to deserialize engine: " + config.model_path);

        bindTensors();

        context_ = engine_->createExecutionContext();
        if (!context_) throw LoadError("Failed to create execution context");

        checkCuda(cudaStreamCreate(&stream_), "cudaStreamCreate");
        allocateBuffers();
    } catch (const LoadError&) {
        release();
        throw;
    } catch (const std::exception& e) {
        release();
        throw LoadError(e.what());
    }
}

void TrtEngine::bindTensors() {
    if (engine_->getNbIOTensors() != 2) {
        throw LoadError("Expected one input and one output tensor, engine has " +
                        std::to_string(engine_->getNbIOTensors()));
    }

    for (int i = 0; i < engine_->getNbIOTensors(); ++i) {
        const char* name = engine_->getIOTensorName(i);
        auto dims = engine_->getTensorShape(name);

        if (engine_->getTensorDataType(name) != nvinfer1::DataType::kFLOAT) {
            throw LoadError(std::string("Tensor ") + name + " is not float32");
        }
        for (int d = 0; d < dims.nbDims; ++d) {
            if (dims.d[d] <= 0) {
                throw LoadError(std::string("Tensor ") + name + " has a dynamic shape");
            }
        }

        if (engine_->getTensorIOMode(name) == nvinfer1::TensorIOMode::kINPUT) {
            if (dims.nbDims != 4 || dims.d[1] != 3) {
                throw LoadError(std::string("Input ") + name + " is not [1, 3, H, W]");
            }
            input_name_ = name;
            input_size_ = volume(dims);
            input_height_ = static_cast<int>(dims.d[2]);
            input_width_ = static_cast<int>(dims.d[3]);
        } else {
            if (dims.nbDims != 3 || dims.d[1] <= 4) {
                throw LoadError(std::string("Output ") + name + " is not [1, 4 + classes, anchors]");
            }
            output_name_ = name;
            output_size_ = volume(dims);
            num_classes_ = static_cast<int>(dims.d[1]) - 4;
            num_anchors_ = static_cast<int>(dims.d[2]);
        }
    }

    if (input_name_.empty() || output_name_.empty()) {
        throw LoadError("Engine must have exactly one input and one output");
    }
    if (num_classes_ != static_cast<int>(config_.class_names.size())) {
        throw LoadError("Engine predicts " + std::to_string(num_classes_) +
                        " classes but the label table has " +
                        std::to_string(config_.class_names.size()));
    }
    if (input_width_ != config_.input_width || input_height_ != config_.input_height) {
        Logger::instance().log(Severity::kWARNING,
            "Engine input is " + std::to_string(input_width_) + "x" + std::to_string(input_height_) +
            ", configured " + std::to_string(config_.input_width) + "x" +
            std::to_string(config_.input_height) + "; using the engine's");
    }
}

void TrtEngine::allocateBuffers() {
    h_input_.resize(input_size_);
    checkCuda(cudaMalloc(&d_input_, input_size_ * sizeof(float)), "cudaMalloc input");
    checkCuda(cudaMalloc(&d_output_, output_size_ * sizeof(float)), "cudaMalloc output");
    checkCuda(cudaMallocHost(reinterpret_cast<void**>(&h_output_), output_size_ * sizeof(float)),
              "cudaMallocHost output");

    if (!context_->setTensorAddress(input_name_.c_str(), d_input_) ||
        !context_->setTensorAddress(output_name_.c_str(), d_output_)) {
        throw LoadError("Failed to bind tensor addresses");
    }
}

RawResult TrtEngine::infer(const cv::Mat& bgr, float conf_threshold, float iou_threshold) {
    if (!isLoaded()) {
        throw NotReadyError("TensorRT engine is not loaded");
    }

    LetterboxInfo info = Preprocessor::process(bgr, h_input_, input_width_, input_height_);

    checkCuda(cudaMemcpyAsync(d_input_, h_input_.data(), input_size_ * sizeof(float),
                              cudaMemcpyHostToDevice, stream_), "cudaMemcpyAsync input");

    if (!context_->enqueueV3(stream_)) {
        throw Error("TensorRT enqueueV3 failed");
    }

    checkCuda(cudaMemcpyAsync(h_output_, d_output_, output_size_ * sizeof(float),
                              cudaMemcpyDeviceToHost, stream_), "cudaMemcpyAsync output");
    checkCuda(cudaStreamSynchronize(stream_), "cudaStreamSynchronize");

    DecodeParams params;
    params.conf_threshold = conf_threshold;
    params.iou_threshold = iou_threshold;
    params.max_detections = config_.max_detections;

    return Postprocessor::process(h_output_, num_anchors_, num_classes_, params, info,
                                  bgr.cols, bgr.rows);
}

} // namespace objdet
