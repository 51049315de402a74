#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace bluest
{

// Fixed-size pool used to run listener callbacks off the scanning thread.
// Tasks run in submission order per thread; no ordering holds across threads.
class WorkerPool
{
  public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool &)            = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // false once shutdown() has started
    bool submit(Task t);

    // Block until the queue is empty and no task is running.
    // Returns immediately when called from one of the pool's own threads.
    void wait_idle();

    // Run what is queued, then join the threads. Idempotent.
    void shutdown();

    bool        on_pool_thread() const;
    std::size_t size() const { return threads_.size(); }

  private:
    void run();

    mutable std::mutex       mu_;
    std::condition_variable  work_cv_;
    std::condition_variable  idle_cv_;
    std::deque<Task>         queue_;
    std::size_t              active_{0};
    bool                     stopping_{false};
    std::vector<std::thread> threads_;
};

}  // namespace bluest
