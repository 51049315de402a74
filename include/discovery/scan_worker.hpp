#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "driver/iscan_driver.hpp"
#include "util/error.hpp"

namespace discovery
{

// Background asynchronous scan: start_async, then process() in slices until
// stop() or the timeout. Driver failures stay on the worker and come back from join().
class ScanWorker
{
  public:
    using OnFinished = std::function<void()>;

    // on_timeout runs on the worker thread after a scan that ended by itself
    ScanWorker(std::shared_ptr<driver::IScanDriver> drv,
               driver::OnAdvertisement              on_adv,
               int                                  timeout_s,
               std::chrono::milliseconds            slice,
               OnFinished                           on_timeout = nullptr);
    ~ScanWorker();

    ScanWorker(const ScanWorker &)            = delete;
    ScanWorker &operator=(const ScanWorker &) = delete;

    void start();
    // Ask the loop to end and wait for it to acknowledge, then stop the driver scan.
    void stop();
    // Wait for the thread. Returns the first failure captured, ok otherwise.
    bluest::Error join();

    bool finished() const;   // loop has exited
    bool timed_out() const;  // loop exited because the timeout elapsed

  private:
    void run();
    bool claim_driver_stop();
    void stop_driver();
    void record(const bluest::Error &e);

    std::shared_ptr<driver::IScanDriver> drv_;
    driver::OnAdvertisement              on_adv_;
    const std::chrono::seconds           timeout_;
    const std::chrono::milliseconds      slice_;
    OnFinished                           on_timeout_;

    mutable std::mutex      mu_;
    std::condition_variable done_cv_;
    bool                    stop_requested_{false};
    bool                    done_{false};
    bool                    timed_out_{false};
    bool                    started_{false};       // start_async succeeded
    bool                    driver_stopped_{false};  // stop_async already claimed
    bluest::Error           failure_;
    std::thread             thr_;
};

}  // namespace discovery
