#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/error.hpp"

namespace driver
{

// One advertising report from a nearby peripheral.
struct Advertisement
{
    std::string               addr;  // "AA:BB:CC:DD:EE:FF"
    std::string               name;
    std::int16_t              rssi        = 0;
    bool                      connectable = true;
    std::vector<std::uint8_t> payload;  // manufacturer-specific AD content, no len/type bytes
};

using Bytes           = std::vector<std::uint8_t>;
using OnAdvertisement = std::function<void(const Advertisement &)>;
using OnNotify        = std::function<void(const Bytes &)>;
using OnLinkLost      = std::function<void()>;

// Platform BLE primitive. Every call may fail with permission_denied or driver_failure.
struct IScanDriver
{
    // Blocking scan for timeout_s seconds; reports arrive on cb from the calling thread.
    virtual bool scan(int timeout_s, const OnAdvertisement &cb, bluest::Error &err) = 0;

    // Asynchronous scan: start, then process() in slices, then stop.
    virtual bool start_async(OnAdvertisement cb, bluest::Error &err)          = 0;
    virtual bool process(std::chrono::milliseconds slice, bluest::Error &err) = 0;
    virtual bool stop_async(bluest::Error &err)                                = 0;

    virtual bool connect(const std::string &addr, OnLinkLost on_lost, bluest::Error &err) = 0;
    virtual bool disconnect(const std::string &addr, bluest::Error &err)                  = 0;
    virtual bool list_characteristics(const std::string        &addr,
                                      std::vector<std::string> &uuids,
                                      bluest::Error            &err)                      = 0;
    virtual bool start_notify(const std::string &addr,
                              const std::string &char_uuid,
                              OnNotify           cb,
                              bluest::Error     &err)                                     = 0;
    virtual bool stop_notify(const std::string &addr,
                             const std::string &char_uuid,
                             bluest::Error     &err)                                      = 0;

    virtual std::string name() const { return ""; }
    virtual ~IScanDriver() = default;
};

}  // namespace driver
