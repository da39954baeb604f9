#pragma once

#include "inference_backend.hpp"
#include "model_config.hpp"
#include "postprocessor.hpp"
#include "preprocessor.hpp"

#include <NvInfer.h>
#include <cuda_runtime.h>
#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace objdet {

// TensorRT backend for YOLOv8-style engines with a single [1, 3, H, W] input and a
// single [1, 4 + num_classes, num_anchors] output.
class TrtEngine : public InferenceBackend {
public:
    TrtEngine();
    ~TrtEngine() override;

    TrtEngine(const TrtEngine&) = delete;
    TrtEngine& operator=(const TrtEngine&) = delete;

    void load(const ModelConfig& config) override;
    RawResult infer(const cv::Mat& bgr, float conf_threshold, float iou_threshold) override;

    int inputWidth() const override { return input_width_; }
    int inputHeight() const override { return input_height_; }

    bool isLoaded() const { return context_ != nullptr; }
    int numClasses() const { return num_classes_; }
    int numAnchors() const { return num_anchors_; }

private:
    void bindTensors();
    void allocateBuffers();
    void release();

    ModelConfig config_;

    nvinfer1::IRuntime* runtime_ = nullptr;
    nvinfer1::ICudaEngine* engine_ = nullptr;
    nvinfer1::IExecutionContext* context_ = nullptr;
    cudaStream_t stream_ = nullptr;

    std::vector<float> h_input_;
    float* h_output_ = nullptr;
    void* d_input_ = nullptr;
    void* d_output_ = nullptr;

    size_t input_size_ = 0;
    size_t output_size_ = 0;
    int input_width_ = 0;
    int input_height_ = 0;
    int num_classes_ = 0;
    int num_anchors_ = 0;

    std::string input_name_;
    std::string output_name_;
};

} // namespace objdet
