// tests/test_util.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "discovery/discovery_manager.hpp"
#include "discovery/listeners.hpp"
#include "driver/iscan_driver.hpp"

namespace testutil
{

// BlueST advertising payload: version 1, device id, big-endian mask, optional MAC
inline driver::Bytes payload(std::uint8_t device_id, std::uint32_t mask, bool with_mac = false)
{
    driver::Bytes p = {0x01, device_id, std::uint8_t(mask >> 24), std::uint8_t(mask >> 16),
                       std::uint8_t(mask >> 8), std::uint8_t(mask)};
    if (with_mac)
    {
        const std::uint8_t mac[] = {0xC0, 0xFF, 0xEE, 0x00, 0x00, 0x01};
        p.insert(p.end(), mac, mac + 6);
    }
    return p;
}

inline driver::Advertisement adv(const std::string &addr,
                                 const std::string &name,
                                 std::int16_t       rssi = -60,
                                 std::uint8_t       device_id = 0x02,
                                 std::uint32_t      mask      = 0x00E00000u)
{
    driver::Advertisement a;
    a.addr    = addr;
    a.name    = name;
    a.rssi    = rssi;
    a.payload = payload(device_id, mask);
    return a;
}

inline bool wait_until(const std::function<bool()> &pred,
                       std::chrono::milliseconds    timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Counts and records every event it gets.
class RecordingListener : public discovery::DiscoveryListener
{
  public:
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> nodes{0};

    void on_discovery_change(discovery::DiscoveryManager &, bool enabled) override
    {
        if (enabled)
            ++starts;
        else
            ++stops;
    }

    void on_node_discovered(discovery::DiscoveryManager &, std::shared_ptr<discovery::Node> node) override
    {
        ++nodes;
        std::lock_guard<std::mutex> lk(mu);
        tags.push_back(node->tag());
    }

    std::vector<std::string> seen()
    {
        std::lock_guard<std::mutex> lk(mu);
        return tags;
    }

  private:
    std::mutex               mu;
    std::vector<std::string> tags;
};

}  // namespace testutil
