#include "util/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "util/log.hpp"

namespace bluest
{

WorkerPool::WorkerPool(std::size_t threads)
{
    if (threads == 0)
        threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
        threads_.emplace_back([this] { run(); });
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(Task t)
{
    if (!t)
        return false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
            return false;
        queue_.push_back(std::move(t));
    }
    work_cv_.notify_one();
    return true;
}

bool WorkerPool::on_pool_thread() const
{
    const auto self = std::this_thread::get_id();
    return std::any_of(threads_.begin(), threads_.end(),
                       [&](const std::thread &t) { return t.get_id() == self; });
}

void WorkerPool::wait_idle()
{
    // a task waiting for the pool it runs on would wait for itself
    if (on_pool_thread())
        return;
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
            return;
        stopping_ = true;
    }
    work_cv_.notify_all();
    const auto self = std::this_thread::get_id();
    for (auto &t : threads_)
    {
        if (!t.joinable())
            continue;
        if (t.get_id() == self)
            t.detach();  // shutdown from inside a task: the thread exits after it returns
        else
            t.join();
    }
}

void WorkerPool::run()
{
    while (true)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            work_cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;  // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("[POOL] listener task threw: %s", e.what());
        }
        catch (...)
        {
            // one listener must not take the pool thread down with it
            LOG_ERROR("[POOL] listener task threw a non-std exception");
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            --active_;
            if (queue_.empty() && active_ == 0)
                idle_cv_.notify_all();
        }
    }
}

}  // namespace bluest
