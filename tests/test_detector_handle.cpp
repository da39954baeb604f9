#include "objdet/detector_handle.hpp"
#include "objdet/errors.hpp"
#include "fake_backend.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace objdet;
using namespace objdet::testing;

namespace {

ModelConfig testModel() {
    ModelConfig config("models/test.engine", testLabels());
    return config;
}

} // namespace

TEST(DetectorHandleTest, ConstructionDoesNotLoad) {
    auto state = std::make_shared<FakeBackendState>();
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    EXPECT_EQ(handle.state(), DetectorHandle::State::Unloaded);
    EXPECT_FALSE(handle.isReady());
    EXPECT_EQ(state->load_calls.load(), 0);
    EXPECT_EQ(handle.modelName(), "test.engine");
}

TEST(DetectorHandleTest, LoadTransitionsToReadyOnce) {
    auto state = std::make_shared<FakeBackendState>();
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    handle.load();
    EXPECT_TRUE(handle.isReady());
    EXPECT_EQ(handle.state(), DetectorHandle::State::Ready);

    handle.load();
    EXPECT_EQ(state->load_calls.load(), 1);
}

TEST(DetectorHandleTest, FailedLoadIsStickyAndCarriesCause) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_failure = "Failed to open engine: models/test.engine";
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    EXPECT_THROW(handle.load(), LoadError);
    EXPECT_EQ(handle.state(), DetectorHandle::State::Failed);
    EXPECT_FALSE(handle.isReady());
    EXPECT_EQ(handle.loadError(), "Failed to open engine: models/test.engine");

    // No retry
    try {
        handle.load();
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_STREQ(e.what(), "Failed to open engine: models/test.engine");
    }
    EXPECT_EQ(state->load_calls.load(), 1);
}

TEST(DetectorHandleTest, UnexpectedLoadExceptionBecomesLoadError) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_throws_runtime_error = true;
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    EXPECT_THROW(handle.load(), LoadError);
    EXPECT_EQ(handle.state(), DetectorHandle::State::Failed);
    EXPECT_EQ(handle.loadError(), "device lost");
}

TEST(DetectorHandleTest, MissingBackendFailsLoad) {
    DetectorHandle handle(testModel(), nullptr);
    EXPECT_THROW(handle.load(), LoadError);
    EXPECT_EQ(handle.state(), DetectorHandle::State::Failed);
}

TEST(DetectorHandleTest, InferBeforeLoadIsNotReady) {
    auto state = std::make_shared<FakeBackendState>();
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(handle.infer(img, 0.5f, 0.45f), NotReadyError);
    EXPECT_EQ(state->infer_calls.load(), 0);
}

TEST(DetectorHandleTest, InferAfterFailedLoadIsNotReady) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_failure = "corrupt";
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));
    EXPECT_THROW(handle.load(), LoadError);

    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(handle.infer(img, 0.5f, 0.45f), NotReadyError);
}

TEST(DetectorHandleTest, InferValidatesThresholds) {
    auto state = std::make_shared<FakeBackendState>();
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));
    handle.load();

    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(handle.infer(img, 1.01f, 0.45f), InvalidParameterError);
    EXPECT_THROW(handle.infer(img, 0.5f, -0.1f), InvalidParameterError);
    EXPECT_NO_THROW(handle.infer(img, 0.0f, 1.0f));
    EXPECT_EQ(state->infer_calls.load(), 1);
}

TEST(DetectorHandleTest, InferRejectsWrongImageLayout) {
    auto state = std::make_shared<FakeBackendState>();
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));
    handle.load();

    cv::Mat gray(10, 10, CV_8UC1, cv::Scalar::all(0));
    EXPECT_THROW(handle.infer(gray, 0.5f, 0.45f), InvalidParameterError);
    EXPECT_THROW(handle.infer(cv::Mat(), 0.5f, 0.45f), InvalidParameterError);
}

TEST(DetectorHandleTest, ConcurrentLoadsRunBackendOnce) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_delay = std::chrono::milliseconds(50);
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&handle] { handle.load(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_TRUE(handle.isReady());
    EXPECT_EQ(state->load_calls.load(), 1);
}

TEST(DetectorHandleTest, NotReadyWhileLoading) {
    auto state = std::make_shared<FakeBackendState>();
    state->load_delay = std::chrono::milliseconds(200);
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));

    std::thread loader([&handle] { handle.load(); });
    while (handle.state() == DetectorHandle::State::Unloaded) std::this_thread::yield();

    EXPECT_FALSE(handle.isReady());
    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(handle.infer(img, 0.5f, 0.45f), NotReadyError);

    loader.join();
    EXPECT_TRUE(handle.isReady());
}

TEST(DetectorHandleTest, SerializesBackendCalls) {
    auto state = std::make_shared<FakeBackendState>();
    state->infer_delay = std::chrono::milliseconds(20);
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));
    handle.load();

    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&handle, &img] { handle.infer(img, 0.5f, 0.45f); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(state->infer_calls.load(), 4);
    EXPECT_EQ(state->max_concurrent_infers.load(), 1);
}

TEST(DetectorHandleTest, InferenceTimeExcludesLockWait) {
    auto state = std::make_shared<FakeBackendState>();
    state->infer_delay = std::chrono::milliseconds(20);
    DetectorHandle handle(testModel(), std::make_unique<FakeBackend>(state));
    handle.load();

    cv::Mat img(10, 10, CV_8UC3, cv::Scalar::all(0));
    std::vector<double> times(4, 0.0);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < times.size(); ++i) {
        threads.emplace_back([&handle, &img, &times, i] {
            times[i] = handle.infer(img, 0.5f, 0.45f).inference_ms;
        });
    }
    for (auto& t : threads) t.join();

    for (double ms : times) {
        EXPECT_GE(ms, 20.0);
        EXPECT_LT(ms, 40.0);
    }
}
