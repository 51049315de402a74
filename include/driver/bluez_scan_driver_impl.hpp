// include/driver/bluez_scan_driver_impl.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "bluez_scan_driver.hpp"

namespace driver
{

// Reply of an async method call, filled by bluez_on_method_reply().
struct PendingCall
{
    std::atomic_bool done{false};
    int              r{0};
    std::string      ename;
    std::string      emsg;
};

struct BluezScanDriver::Impl
{
#if BLUEST_HAVE_SDBUS
    sd_bus      *bus          = nullptr;
    sd_bus_slot *added_slot   = nullptr;  // InterfacesAdded (only while scanning)
    sd_bus_slot *removed_slot = nullptr;  // InterfacesRemoved
    sd_bus_slot *props_slot   = nullptr;  // PropertiesChanged (scan + notifications)
#endif
    // serialize all sd-bus access; bus callbacks run with it held
    std::mutex bus_mu;

    std::string      adapter_path;  // "/org/bluez/hci0"
    std::string      unique_name;   // our bus unique name (debug)
    std::atomic_bool discovery_on{false};
    std::atomic<std::uint64_t> scan_gen{0};  // bumped by every stop_async

    // ---- guarded by bus_mu ----
    OnAdvertisement                                  sink;
    std::unordered_map<std::string, DeviceProps>     devices;     // device path -> props
    std::unordered_map<std::string, OnLinkLost>      links;       // device path -> link lost cb
    std::unordered_map<std::string, OnNotify>        notify;      // char path -> value cb
    std::map<std::string, std::map<std::string, std::string>> chars;  // dev path -> uuid -> path

    // Work produced by callbacks, run by pump() once bus_mu is released
    // so user code may call back into the driver.
    std::vector<std::function<void()>> deferred;
};

}  // namespace driver
