#include "lfsplit/worker_pool.hpp"

#include "lfsplit/errors.hpp"

namespace lfsplit {

WorkerPool::WorkerPool(std::size_t concurrency) : concurrency_(concurrency) {
    if (concurrency_ == 0) {
        throw ConfigError("concurrency must be > 0");
    }
    threads_.reserve(concurrency_);
    for (std::size_t i = 0; i < concurrency_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_thread, this);
    }
}

WorkerPool::~WorkerPool() { wait_for_completion(); }

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw Error("worker pool is already stopped");
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::wait_for_completion() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::concurrency() const noexcept { return concurrency_; }

void WorkerPool::worker_thread() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace lfsplit
