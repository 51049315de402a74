#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "driver/iscan_driver.hpp"
#include "util/constants.hpp"

#if BLUEST_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

namespace driver
{

struct BluezConfig
{
    std::string adapter        = std::string(constants::DEFAULT_ADAPTER);
    bool        duplicate_data = true;  // keep RSSI reports coming for already known devices
};

// Device1 properties as last seen on the bus. The have_* flags mark what a
// signal actually carried so partial updates can be merged.
struct DeviceProps
{
    std::string  addr;
    std::string  name;
    std::int16_t rssi              = 0;
    Bytes        mfr;  // [company lo][company hi][data...]
    bool         have_name         = false;
    bool         have_rssi         = false;
    bool         have_mfr          = false;
    bool         have_connected    = false;
    bool         connected         = false;
    bool         have_resolved     = false;
    bool         services_resolved = false;

    void merge(const DeviceProps &patch);
};

class BluezScanDriver final : public IScanDriver
{
  public:
    explicit BluezScanDriver(BluezConfig cfg);
    ~BluezScanDriver() override;

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
    std::string name() const override;

    const BluezConfig &config() const { return cfg_; }
    std::string        device_path(const std::string &addr) const;
    bool               discovering() const;

    // bus callbacks, called with the bus mutex held
    void on_device_props(const char *path, const DeviceProps &patch, bool added);
    void on_device_removed(const char *path);
    void on_char_value(const char *path, const std::uint8_t *data, std::size_t len);

  private:
    BluezConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool open_bus(bluest::Error &err);
    void close_bus();
    bool pump(std::chrono::milliseconds slice, bluest::Error &err);
    bool prime_device_cache(bluest::Error &err);
    bool set_discovery_filter();
    bool call_and_wait(const std::string        &path,
                       const char               *iface,
                       const char               *method,
                       std::chrono::milliseconds timeout,
                       bluest::Error            &err);
    bool wait_services_resolved(const std::string &dev_path, std::chrono::milliseconds timeout);
    bool resolve_char_path(const std::string &addr,
                           const std::string &uuid,
                           std::string       &path,
                           bluest::Error     &err);
};

}  // namespace driver
