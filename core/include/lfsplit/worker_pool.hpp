#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lfsplit {

// Fixed set of threads draining a FIFO of jobs. Jobs must not throw.
class WorkerPool {
  public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t concurrency);

    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(Job job);

    // Runs every queued job, then joins the threads. No jobs may be submitted afterwards.
    void wait_for_completion();

    std::size_t concurrency() const noexcept;

  private:
    void worker_thread();

    std::size_t concurrency_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Job> jobs_;
    bool stop_{false};
    std::vector<std::thread> threads_;
};

} // namespace lfsplit
