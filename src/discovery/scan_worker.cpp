#include <algorithm>
#include <utility>

#include "discovery/scan_worker.hpp"
#include "util/log.hpp"

namespace discovery
{

ScanWorker::ScanWorker(std::shared_ptr<driver::IScanDriver> drv,
                       driver::OnAdvertisement              on_adv,
                       int                                  timeout_s,
                       std::chrono::milliseconds            slice,
                       OnFinished                           on_timeout)
    : drv_(std::move(drv)),
      on_adv_(std::move(on_adv)),
      timeout_(timeout_s),
      slice_(slice.count() > 0 ? slice : std::chrono::milliseconds(1)),
      on_timeout_(std::move(on_timeout))
{
}

ScanWorker::~ScanWorker()
{
    if (!thr_.joinable())
        return;
    if (thr_.get_id() == std::this_thread::get_id())
    {
        // destroyed from our own on_timeout callback
        thr_.detach();
        return;
    }
    stop();
    bluest::Error e = join();
    if (e)
        LOG_WARN("[SCAN] worker dropped with failure: %s", bluest::to_string(e).c_str());
}

void ScanWorker::start()
{
    thr_ = std::thread([this] { run(); });
}

void ScanWorker::record(const bluest::Error &e)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!failure_)
        failure_ = e;
}

bool ScanWorker::claim_driver_stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!started_ || driver_stopped_)
        return false;
    driver_stopped_ = true;
    return true;
}

void ScanWorker::stop_driver()
{
    if (!claim_driver_stop())
        return;
    bluest::Error e;
    if (!drv_->stop_async(e))
    {
        LOG_WARN("[SCAN] stop_async failed: %s", bluest::to_string(e).c_str());
        record(e);
    }
}

void ScanWorker::run()
{
    using namespace std::chrono;

    bluest::Error e;
    if (!drv_->start_async(on_adv_, e))
    {
        LOG_ERROR("[SCAN] start_async failed: %s", bluest::to_string(e).c_str());
        record(e);
        {
            std::lock_guard<std::mutex> lk(mu_);
            done_ = true;
        }
        done_cv_.notify_all();
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        started_ = true;
    }
    LOG_INFO("[SCAN] async scan running, timeout %lds", (long)timeout_.count());

    const auto deadline = steady_clock::now() + timeout_;
    while (true)
    {
        const auto now = steady_clock::now();
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_requested_)
                break;
            if (now >= deadline)
            {
                timed_out_ = true;
                break;
            }
        }
        const auto left = duration_cast<milliseconds>(deadline - now);
        if (!drv_->process(std::min(slice_, std::max(left, milliseconds(1))), e))
        {
            LOG_ERROR("[SCAN] process failed: %s", bluest::to_string(e).c_str());
            record(e);
            break;
        }
    }

    bool timed_out = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        done_     = true;
        timed_out = timed_out_;
    }
    done_cv_.notify_all();

    if (timed_out)
    {
        LOG_INFO("[SCAN] timeout reached, stopping");
        stop_driver();
        if (on_timeout_)
            on_timeout_();
    }
}

void ScanWorker::stop()
{
    {
        std::unique_lock<std::mutex> lk(mu_);
        stop_requested_ = true;
        if (thr_.joinable())
            done_cv_.wait(lk, [this] { return done_; });
    }
    stop_driver();
}

bluest::Error ScanWorker::join()
{
    if (thr_.joinable() && thr_.get_id() != std::this_thread::get_id())
        thr_.join();
    std::lock_guard<std::mutex> lk(mu_);
    return failure_;
}

bool ScanWorker::finished() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return done_;
}

bool ScanWorker::timed_out() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return timed_out_;
}

}  // namespace discovery
