#include "objdet/prediction_pool.hpp"
#include "objdet/logger.hpp"

namespace objdet {

PredictionPool::PredictionPool(const DetectionService& service, size_t num_workers)
    : service_(service), num_workers_(num_workers == 0 ? 1 : num_workers) {}

PredictionPool::~PredictionPool() {
    stop();
}

bool PredictionPool::start() {
    if (running_) return false;
    // Workers left over from a drained run have already exited their loop
    joinWorkers();

    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        std::queue<PredictionJob> empty;
        std::swap(job_queue_, empty);
        running_ = true;
        accepting_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        std::queue<PoolResult> empty;
        std::swap(result_queue_, empty);
        active_workers_ = num_workers_;
    }

    workers_.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        workers_.emplace_back(&PredictionPool::workerThread, this);
    }
    return true;
}

void PredictionPool::stop() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        running_ = false;
        accepting_ = false;
        std::queue<PredictionJob> empty;
        std::swap(job_queue_, empty);
    }
    job_cv_.notify_all();
    {
        // getResult() checks running_ under this lock
        std::lock_guard<std::mutex> lock(result_mutex_);
    }
    result_cv_.notify_all();

    joinWorkers();
}

void PredictionPool::joinWorkers() {
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void PredictionPool::finish() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        accepting_ = false;
    }
    job_cv_.notify_all();
}

bool PredictionPool::submit(PredictionJob job) {
    {
        std::unique_lock<std::mutex> lock(job_mutex_);
        job_cv_.wait(lock, [this] {
            return job_queue_.size() < max_job_queue_ || !accepting_ || !running_;
        });

        if (!accepting_ || !running_) return false;

        job_queue_.push(std::move(job));
    }
    job_cv_.notify_all();
    return true;
}

void PredictionPool::workerThread() {
    while (true) {
        PredictionJob job;

        {
            std::unique_lock<std::mutex> lock(job_mutex_);
            job_cv_.wait(lock, [this] {
                return !job_queue_.empty() || !accepting_ || !running_;
            });

            if (!running_) break;
            if (job_queue_.empty()) break;  // finished and drained

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }
        // Wake a blocked submit()
        job_cv_.notify_all();

        PoolResult result = run(job);

        {
            std::unique_lock<std::mutex> lock(result_mutex_);
            result_cv_.wait(lock, [this] {
                return result_queue_.size() < max_result_queue_ || !running_;
            });
            if (!running_) break;

            result_queue_.push(std::move(result));
        }
        result_cv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        // Last worker out after finish(): the run is over
        if (--active_workers_ == 0) running_ = false;
    }
    result_cv_.notify_all();
}

PoolResult PredictionPool::run(PredictionJob& job) const {
    PoolResult result;
    result.id = job.id;
    result.name = std::move(job.name);

    try {
        result.response = service_.predict(job.bytes, job.conf_threshold, job.iou_threshold);
        result.ok = true;
    } catch (const Error& e) {
        result.error_kind = e.kind();
        result.error = e.what();
        logWarning("Job " + std::to_string(result.id) + " (" + result.name + ") failed: " +
                   errorKindName(e.kind()) + ": " + e.what());
    } catch (const std::exception& e) {
        // Outermost boundary of the worker thread
        result.error_kind = ErrorKind::Internal;
        result.error = e.what();
        logError("Job " + std::to_string(result.id) + " (" + result.name +
                 ") raised an unexpected error: " + e.what());
    }
    return result;
}

bool PredictionPool::getResult(PoolResult& result) {
    std::unique_lock<std::mutex> lock(result_mutex_);
    result_cv_.wait(lock, [this] {
        return !result_queue_.empty() || active_workers_ == 0 || !running_;
    });

    if (result_queue_.empty()) return false;

    result = std::move(result_queue_.front());
    result_queue_.pop();
    lock.unlock();
    // Wake a worker blocked on a full result queue
    result_cv_.notify_all();
    return true;
}

bool PredictionPool::tryGetResult(PoolResult& result) {
    {
        std::lock_guard<std::mutex> lock(result_mutex_);

        if (result_queue_.empty()) return false;

        result = std::move(result_queue_.front());
        result_queue_.pop();
    }
    result_cv_.notify_all();
    return true;
}

size_t PredictionPool::getJobQueueSize() const {
    std::lock_guard<std::mutex> lock(job_mutex_);
    return job_queue_.size();
}

size_t PredictionPool::getResultQueueSize() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_queue_.size();
}

} // namespace objdet
