#pragma once

#include "detection.hpp"
#include "detection_service.hpp"
#include "errors.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace objdet {

struct PredictionJob {
    int id = 0;
    std::string name;
    std::vector<uint8_t> bytes;
    std::optional<float> conf_threshold;
    std::optional<float> iou_threshold;
};

struct PoolResult {
    int id = 0;
    std::string name;
    bool ok = false;
    PredictionResponse response;
    ErrorKind error_kind = ErrorKind::Internal;
    std::string error;
};

// Runs predict() for queued jobs on a fixed set of worker threads sharing one service
class PredictionPool {
public:
    PredictionPool(const DetectionService& service, size_t num_workers = 2);
    ~PredictionPool();

    // Non-copyable
    PredictionPool(const PredictionPool&) = delete;
    PredictionPool& operator=(const PredictionPool&) = delete;

    // False while workers are running. A pool drained by finish() can be started again.
    bool start();

    // Drops pending jobs and joins the workers
    void stop();

    // No more jobs; workers exit once the queue drains and isRunning() turns false.
    // Results must be consumed meanwhile: workers block while the result queue is full.
    void finish();

    // Blocks while the job queue is full. Returns false once finished or stopped.
    bool submit(PredictionJob job);

    // Get next result (blocks if not ready, returns false once drained or stopped)
    bool getResult(PoolResult& result);

    // Try to get result without blocking
    bool tryGetResult(PoolResult& result);

    bool isRunning() const { return running_; }

    size_t getJobQueueSize() const;
    size_t getResultQueueSize() const;

    void setMaxJobQueueSize(size_t size) { max_job_queue_ = size; }
    void setMaxResultQueueSize(size_t size) { max_result_queue_ = size; }

private:
    void workerThread();
    void joinWorkers();
    PoolResult run(PredictionJob& job) const;

    const DetectionService& service_;
    size_t num_workers_;
    std::vector<std::thread> workers_;

    std::queue<PredictionJob> job_queue_;
    mutable std::mutex job_mutex_;
    std::condition_variable job_cv_;

    std::queue<PoolResult> result_queue_;
    mutable std::mutex result_mutex_;
    std::condition_variable result_cv_;

    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};
    std::atomic<size_t> active_workers_{0};

    size_t max_job_queue_ = 16;
    size_t max_result_queue_ = 16;
};

} // namespace objdet
