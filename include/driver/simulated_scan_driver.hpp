#pragma once
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "driver/iscan_driver.hpp"

namespace driver
{

// In-process radio: scripted advertisements, injected failures, no hardware.
// Used by the tests and by the CLI with BLUEST_DRIVER=sim.
class SimulatedScanDriver final : public IScanDriver
{
  public:
    enum class Op
    {
        Scan,
        Start,
        Process,
        Stop,
        Connect,
        Disconnect,
        List,
        Notify
    };
    using Generator = std::function<std::vector<Advertisement>(std::size_t slice)>;

    bool scan(int timeout_s, const OnAdvertisement &cb, bluest::Error &err) override;
    bool start_async(OnAdvertisement cb, bluest::Error &err) override;
    bool process(std::chrono::milliseconds slice, bluest::Error &err) override;
    bool stop_async(bluest::Error &err) override;
    bool connect(const std::string &addr, OnLinkLost on_lost, bluest::Error &err) override;
    bool disconnect(const std::string &addr, bluest::Error &err) override;
    bool list_characteristics(const std::string        &addr,
                              std::vector<std::string> &uuids,
                              bluest::Error            &err) override;
    bool start_notify(const std::string &addr,
                      const std::string &char_uuid,
                      OnNotify           cb,
                      bluest::Error     &err) override;
    bool stop_notify(const std::string &addr,
                     const std::string &char_uuid,
                     bluest::Error     &err) override;
    std::string name() const override { return "sim"; }

    // ---- scripting ----
    // delivered once, on the next scan() or process() slice
    void queue_advertisement(Advertisement a);
    // called for every slice (scan() counts as slice 0)
    void set_generator(Generator g);
    // the next call of `op` fails with e (one-shot per call to fail_next)
    void fail_next(Op op, bluest::Error e);
    // milliseconds slept per scan() second; 1000 is real time
    void set_ms_per_second(unsigned ms) { ms_per_second_.store(ms); }

    void add_characteristic(const std::string &addr, const std::string &uuid);
    // delivered on the next process() call
    void queue_notification(const std::string &addr, const std::string &uuid, Bytes value);
    // drop the link as if the peer went away
    bool drop_link(const std::string &addr);

    // ---- observation ----
    bool        async_active() const;
    bool        is_connected(const std::string &addr) const;
    bool        is_notifying(const std::string &addr, const std::string &uuid) const;
    std::size_t start_calls() const { return start_calls_.load(); }
    std::size_t stop_calls() const { return stop_calls_.load(); }
    std::size_t process_calls() const { return process_calls_.load(); }
    std::size_t scan_calls() const { return scan_calls_.load(); }
    std::size_t connect_calls() const { return connect_calls_.load(); }

  private:
    bool take_failure(Op op, bluest::Error &err);
    void deliver_slice(const OnAdvertisement &cb, std::size_t slice);

    using Key = std::pair<std::string, std::string>;  // addr, uuid (lower case)

    mutable std::mutex                         mu_;
    std::map<Op, bluest::Error>                failures_;
    std::vector<Advertisement>                 queued_;
    Generator                                  generator_;
    OnAdvertisement                            sink_;
    bool                                       async_on_{false};
    std::size_t                                slice_no_{0};
    std::map<std::string, OnLinkLost>          links_;
    std::map<std::string, std::set<std::string>> chars_;
    std::map<Key, OnNotify>                    notify_;
    std::vector<std::pair<Key, Bytes>>         pending_notify_;

    std::atomic<unsigned>    ms_per_second_{1000};
    std::atomic<std::size_t> start_calls_{0};
    std::atomic<std::size_t> stop_calls_{0};
    std::atomic<std::size_t> process_calls_{0};
    std::atomic<std::size_t> scan_calls_{0};
    std::atomic<std::size_t> connect_calls_{0};
};

}  // namespace driver
