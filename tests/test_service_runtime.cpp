#include "objdet/service_runtime.hpp"
#include "fake_backend.hpp"

#include <gtest/gtest.h>

using namespace objdet;
using namespace objdet::testing;

namespace {

ServiceConfig runtimeConfig() {
    ServiceConfig config = ServiceConfig::defaults();
    config.model.model_name = "yolov8n";
    config.model.class_names = testLabels();
    config.log_level = "error";
    return config;
}

std::string pngBytes(int w = 32, int h = 24) {
    return encodeImage(cv::Mat(h, w, CV_8UC3, cv::Scalar::all(0)));
}

} // namespace

TEST(ServiceRuntimeTest, HealthReportsUnhealthyUntilStarted) {
    auto state = std::make_shared<FakeBackendState>();
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));

    Reply health = runtime.healthReply();
    EXPECT_EQ(health.status, 200);
    EXPECT_EQ(health.body["status"], "unhealthy");
    EXPECT_EQ(health.body["model_loaded"], false);

    EXPECT_TRUE(runtime.start());
    health = runtime.healthReply();
    EXPECT_EQ(health.body["status"], "healthy");
    EXPECT_EQ(health.body["model_name"], "yolov8n");
    EXPECT_EQ(health.body["version"], "1.0.0");
}

TEST(ServiceRuntimeTest, FailedLoadKeepsRuntimeAlive) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_failure = "Failed to open engine: yolov8n.engine";
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));

    EXPECT_FALSE(runtime.start());
    EXPECT_FALSE(runtime.isReady());
    EXPECT_EQ(runtime.healthReply().body["status"], "unhealthy");

    Reply reply = runtime.handleUpload("a.png", "image/png", pngBytes());
    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(reply.body["detail"], "Model not loaded. Service unavailable.");
}

TEST(ServiceRuntimeTest, SuccessfulUpload) {
    auto state = std::make_shared<FakeBackendState>();
    state->result.add(1.9f, 2.1f, 20.5f, 22.0f, 0.75f, 1);
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));
    runtime.start();

    Reply reply = runtime.handleUpload("street.png", "image/png", pngBytes(32, 24));
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["num_detections"], 1);
    EXPECT_EQ(reply.body["detections"][0]["class_name"], "bicycle");
    EXPECT_EQ(reply.body["detections"][0]["bbox"]["x_min"], 1);
    EXPECT_EQ(reply.body["image_dimensions"][0], 32);
    EXPECT_EQ(reply.body["image_dimensions"][1], 24);
    EXPECT_EQ(reply.body["model_name"], "yolov8n");
}

TEST(ServiceRuntimeTest, MapsErrorsToStatusCodes) {
    auto state = std::make_shared<FakeBackendState>();
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));
    runtime.start();

    EXPECT_EQ(runtime.handleUpload("test.txt", "text/plain", "not an image").status, 400);
    EXPECT_EQ(runtime.handleUpload("a.gif", "image/gif", "GIF89a").status, 400);
    EXPECT_EQ(runtime.handleUpload("fake.png", "image/png", "not an image").status, 400);
    EXPECT_EQ(runtime.handleUpload("a.png", "image/png", pngBytes(), 1.01f).status, 422);
    EXPECT_EQ(runtime.handleUpload("a.png", "image/png", pngBytes(), std::nullopt, -0.1f).status, 422);
}

TEST(ServiceRuntimeTest, OversizedUploadIs413) {
    auto state = std::make_shared<FakeBackendState>();
    ServiceConfig config = runtimeConfig();
    config.upload.max_file_size = 16;
    ServiceRuntime runtime(config, std::make_unique<FakeBackend>(state));
    runtime.start();

    Reply reply = runtime.handleUpload("a.png", "image/png", pngBytes());
    EXPECT_EQ(reply.status, 413);
    EXPECT_EQ(state->infer_calls.load(), 0);
}

TEST(ServiceRuntimeTest, DetectorContractBreachIs500) {
    auto state = std::make_shared<FakeBackendState>();
    state->result.add(0, 0, 10, 10, 0.9f, 42);
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));
    runtime.start();

    Reply reply = runtime.handleUpload("a.png", "image/png", pngBytes());
    EXPECT_EQ(reply.status, 500);
    EXPECT_NE(reply.body["detail"].get<std::string>().find("Prediction failed"), std::string::npos);
}

TEST(ServiceRuntimeTest, InfoReplyNamesService) {
    auto state = std::make_shared<FakeBackendState>();
    ServiceRuntime runtime(runtimeConfig(), std::make_unique<FakeBackend>(state));
    Reply info = runtime.infoReply();
    EXPECT_EQ(info.body["message"], "Object Detection API");
    EXPECT_EQ(info.body["version"], "1.0.0");
}
