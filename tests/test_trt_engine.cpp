#include "objdet/errors.hpp"
#include "objdet/trt_engine.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace objdet;

TEST(TrtEngineTest, MissingEngineFileIsLoadError) {
    TrtEngine engine;
    ModelConfig config("/nonexistent/yolov8n.engine", {"person"});
    try {
        engine.load(config);
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/yolov8n.engine"), std::string::npos);
    }
    EXPECT_FALSE(engine.isLoaded());
}

TEST(TrtEngineTest, EmptyEngineFileIsLoadError) {
    const std::string path = "objdet_empty_test.engine";
    { std::ofstream out(path, std::ios::binary); }

    TrtEngine engine;
    EXPECT_THROW(engine.load(ModelConfig(path, {"person"})), LoadError);
    EXPECT_FALSE(engine.isLoaded());
    std::remove(path.c_str());
}

TEST(TrtEngineTest, InferBeforeLoadIsNotReady) {
    TrtEngine engine;
    cv::Mat img(8, 8, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(engine.infer(img, 0.5f, 0.45f), NotReadyError);
}
