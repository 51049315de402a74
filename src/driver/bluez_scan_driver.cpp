/* ======================================================================
 * BlueZ scan driver: scan path
 *
 *  Caller / scan worker                 sd-bus (bus_mu)                   BlueZ
 *  --------------------                 ---------------                   -----
 *  start_async(cb)
 *    └─ open_bus (lazy) ───────────────▶ sd_bus_open_system
 *    └─ match signals ─────────────────▶ InterfacesAdded/Removed, PropertiesChanged
 *    └─ prime_device_cache ────────────────────────────────────────────▶ ObjectManager.GetManagedObjects
 *    └─ set_discovery_filter ──────────────────────────────────────────▶ Adapter1.SetDiscoveryFilter
 *    └─ StartDiscovery ────────────────────────────────────────────────▶ Adapter1.StartDiscovery
 *
 *  process(slice)
 *    └─ sd_bus_process (under bus_mu) ◀── signals: on_device_props / on_char_value
 *    └─ run deferred callbacks (outside bus_mu) ──▶ cb(Advertisement) / OnNotify
 *    └─ sd_bus_wait (outside bus_mu) until the slice has elapsed
 *
 *  stop_async()
 *    └─ StopDiscovery ─────────────────────────────────────────────────▶ Adapter1.StopDiscovery
 *    └─ drop sink and scan-only matches
 *
 *  scan(timeout, cb) = start_async + process(1s slices) + stop_async
 *
 *  Notes
 *    └─ All DBus calls are made under impl_->bus_mu, never while waiting
 *    └─ Callbacks only record work; user code runs after bus_mu is released
 * ====================================================================== */

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

// clang-format off
#include "driver/bluez_scan_driver.hpp"
#include "driver/bluez_scan_driver_impl.hpp"
#include "driver/bluez_dbus_util.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

#if BLUEST_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "driver/bluez_helper_scan.hpp"

namespace
{

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds (or is already in progress)
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on,
                                           bluest::Error     &out)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        out = bus_error(r, &err, "StartDiscovery");
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StopDiscovery succeeds or discovery was already off
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
static bool adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on,
                                          bluest::Error     &out)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    discovery_on.store(false);
    if (r < 0)
    {
        // "No discovery started" means somebody else already stopped it
        const char *emsg = err.message ? err.message : "";
        if (err.name && std::strcmp(err.name, "org.bluez.Error.Failed") == 0 &&
            std::strstr(emsg, "No discovery started"))
        {
            LOG_DEBUG("[BLUEZ] StopDiscovery: already off");
            sd_bus_error_free(&err);
            return true;
        }
        out = bus_error(r, &err, "StopDiscovery");
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s", out.message.c_str());
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    return true;
}

}  // namespace
#endif

namespace driver
{

void DeviceProps::merge(const DeviceProps &patch)
{
    if (!patch.addr.empty())
        addr = patch.addr;
    if (patch.have_name)
    {
        name      = patch.name;
        have_name = true;
    }
    if (patch.have_rssi)
    {
        rssi      = patch.rssi;
        have_rssi = true;
    }
    if (patch.have_mfr)
    {
        mfr      = patch.mfr;
        have_mfr = true;
    }
    if (patch.have_connected)
    {
        connected      = patch.connected;
        have_connected = true;
    }
    if (patch.have_resolved)
    {
        services_resolved = patch.services_resolved;
        have_resolved     = true;
    }
}

BluezScanDriver::BluezScanDriver(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezScanDriver::~BluezScanDriver()
{
    if (impl_->discovery_on.load())
    {
        bluest::Error err;
        if (!stop_async(err))
            LOG_WARN("[BLUEZ] stop on teardown: %s", bluest::to_string(err).c_str());
    }
    close_bus();
}

std::string BluezScanDriver::name() const
{
    return "bluez";
}

std::string BluezScanDriver::device_path(const std::string &addr) const
{
    std::string tail = to_upper_str(addr);
    std::replace(tail.begin(), tail.end(), ':', '_');
    return impl_->adapter_path + "/dev_" + tail;
}

bool BluezScanDriver::discovering() const
{
    return impl_->discovery_on.load();
}

// ======================================================================
// Function: BluezScanDriver::open_bus
// - In: any thread
// - Out: true once the system bus is connected and PropertiesChanged is matched
// - Note: lazy, the first primitive that needs the bus opens it
// ======================================================================
bool BluezScanDriver::open_bus(bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    err = bluest::make_error(bluest::Errc::driver_failure,
                             "built without sd-bus (BLUEST_HAVE_SDBUS=0)");
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->bus)
        return true;

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        impl_->bus = nullptr;
        err        = bus_error(r, nullptr, "connect to system bus");
        LOG_ERROR("[BLUEZ] %s", err.message.c_str());
        return false;
    }

    const char *uname = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &uname) >= 0 && uname)
        impl_->unique_name = uname;

    // PropertiesChanged (Device1 RSSI/ManufacturerData, GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
    {
        err = bus_error(r, nullptr, "subscribe to PropertiesChanged");
        LOG_ERROR("[BLUEZ] %s", err.message.c_str());
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    }
    LOG_INFO("[BLUEZ] connected to system bus as %s, adapter=%s", impl_->unique_name.c_str(),
             impl_->adapter_path.c_str());
    return true;
#endif
}

void BluezScanDriver::close_bus()
{
#if BLUEST_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    impl_->sink = nullptr;
    impl_->links.clear();
    impl_->notify.clear();
    impl_->deferred.clear();
#endif
}

// ======================================================================
// Function: BluezScanDriver::pump
// - In: bus open
// - Out: processes bus traffic for `slice`, false on a bus failure
// - Note: never holds bus_mu while waiting or while running user callbacks
// ======================================================================
bool BluezScanDriver::pump(std::chrono::milliseconds slice, bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)slice;
    err = bluest::make_error(bluest::Errc::driver_failure,
                             "built without sd-bus (BLUEST_HAVE_SDBUS=0)");
    return false;
#else
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + slice;
    while (true)
    {
        std::vector<std::function<void()>> ready;
        sd_bus                            *bus = nullptr;
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            bus = impl_->bus;
            if (!bus)
            {
                err = bluest::make_error(bluest::Errc::driver_failure, "bus is closed");
                return false;
            }
            while (true)
            {
                int pr = sd_bus_process(bus, nullptr);
                if (pr < 0)
                {
                    err = bus_error(pr, nullptr, "sd_bus_process");
                    return false;
                }
                if (pr == 0)
                    break;
            }
            ready.swap(impl_->deferred);
        }

        for (auto &fn : ready)
            fn();

        const auto now = steady_clock::now();
        if (now >= deadline)
            break;
        // do not hold the lock while waiting, other threads need the bus
        const auto usec = (uint64_t)duration_cast<microseconds>(deadline - now).count();
        int        wr   = sd_bus_wait(bus, usec);
        if (wr < 0 && wr != -EINTR)
        {
            err = bus_error(wr, nullptr, "sd_bus_wait");
            return false;
        }
    }
    return true;
#endif
}

// ======================================================================
// Function: BluezScanDriver::prime_device_cache
// - In: bus open
// - Out: devices map filled from GetManagedObjects, nothing is reported
// - Note: PropertiesChanged only carries deltas, the cache supplies the rest
// ======================================================================
bool BluezScanDriver::prime_device_cache(bluest::Error &out)
{
#if !BLUEST_HAVE_SDBUS
    (void)out;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_message             *reply = nullptr;
    sd_bus_error                err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        out = bus_error(r, &err, "GetManagedObjects");
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    const std::string dev_prefix = impl_->adapter_path + "/dev_";
    std::size_t       n          = 0;
    r = walk_managed_objects(
        reply, dev_prefix,
        [&](const std::string &path, const char *iface, sd_bus_message *m, bool &consumed) -> int {
            if (!iface || std::strcmp(iface, "org.bluez.Device1") != 0 ||
                path_to_mac(path).empty())
                return 0;
            DeviceProps props;
            int         rr = parse_device1_props(m, props);
            consumed       = true;
            if (rr < 0)
                return rr;
            impl_->devices[path].merge(props);
            ++n;
            return 0;
        });

    sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        out = bus_error(r, nullptr, "walk GetManagedObjects");
        return false;
    }
    LOG_DEBUG("[BLUEZ] device cache primed with %zu known devices", n);
    return true;
#endif
}

// ======================================================================
// Function: BluezScanDriver::set_discovery_filter
// - In: bus open
// - Out: true when Adapter1.SetDiscoveryFilter(Transport=le, DuplicateData) succeeds
// - Note: failure is not fatal, BlueZ then scans with its defaults
// ======================================================================
bool BluezScanDriver::set_discovery_filter()
{
#if !BLUEST_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int             r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                                       impl_->adapter_path.c_str(),
                                                       "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    // DuplicateData: report every advertisement so RSSI stays fresh
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", cfg_.duplicate_data ? 1 : 0);
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, DuplicateData=%d)",
             (int)cfg_.duplicate_data);
    return true;
#endif
}

// ======================================================================
// Function: BluezScanDriver::start_async
// - In: cb receives every advertisement seen while discovery is on
// - Out: true when the adapter is discovering
// ======================================================================
bool BluezScanDriver::start_async(OnAdvertisement cb, bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)cb;
    err = bluest::make_error(bluest::Errc::driver_failure,
                             "built without sd-bus (BLUEST_HAVE_SDBUS=0)");
    return false;
#else
    if (!open_bus(err))
        return false;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        int                         r = 0;
        if (!impl_->added_slot)
        {
            r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                                    "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                                    bluez_on_iface_added, this);
        }
        if (r >= 0 && !impl_->removed_slot)
        {
            r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                    "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                    bluez_on_iface_removed, this);
        }
        if (r < 0)
        {
            err = bus_error(r, nullptr, "subscribe to InterfacesAdded/Removed");
            LOG_ERROR("[BLUEZ] %s", err.message.c_str());
            unref_slot(impl_->added_slot);
            unref_slot(impl_->removed_slot);
            return false;
        }
    }

    bluest::Error cache_err;
    if (!prime_device_cache(cache_err))
    {
        // a denied ObjectManager call means StartDiscovery will be denied too
        if (cache_err.code == bluest::Errc::permission_denied)
        {
            err = cache_err;
            return false;
        }
        LOG_WARN("[BLUEZ] %s (continuing with an empty cache)", cache_err.message.c_str());
    }

    (void)set_discovery_filter();

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on,
                                        err))
    {
        LOG_ERROR("[BLUEZ] %s", err.message.c_str());
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        return false;
    }
    impl_->sink = std::move(cb);
    return true;
#endif
}

bool BluezScanDriver::process(std::chrono::milliseconds slice, bluest::Error &err)
{
    if (!open_bus(err))
        return false;
    return pump(slice, err);
}

// ======================================================================
// Function: BluezScanDriver::stop_async
// - In: any thread, also when discovery is already off
// - Out: false only when StopDiscovery failed for a real reason
// ======================================================================
bool BluezScanDriver::stop_async(bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)err;
    return true;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->sink = nullptr;
    impl_->scan_gen.fetch_add(1);
    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    if (!impl_->bus || !impl_->discovery_on.load())
        return true;
    return adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on,
                                         err);
#endif
}

// ======================================================================
// Function: BluezScanDriver::scan
// - In: timeout in seconds, cb runs on the calling thread
// - Out: true when the whole window was scanned
// ======================================================================
bool BluezScanDriver::scan(int timeout_s, const OnAdvertisement &cb, bluest::Error &err)
{
    if (!start_async(cb, err))
        return false;

    using namespace std::chrono;
    const auto deadline = steady_clock::now() + seconds(timeout_s);
    bool       ok       = true;
    while (ok)
    {
        const auto now = steady_clock::now();
        if (now >= deadline)
            break;
        const auto left = duration_cast<milliseconds>(deadline - now);
        ok              = process(std::min(left, constants::SCAN_SLICE), err);
    }

    bluest::Error stop_err;
    if (!stop_async(stop_err) && ok)
    {
        err = stop_err;
        return false;
    }
    return ok;
}

// ======================================================================
// Function: BluezScanDriver::on_device_props
// - In: bus_mu held (bus callback); patch carries what the signal had
// - Out: cache updated, advertisement queued for the sink while discovering
// ======================================================================
void BluezScanDriver::on_device_props(const char *path, const DeviceProps &patch, bool added)
{
    const std::string p(path);
    auto             &dev = impl_->devices[p];
    dev.merge(patch);
    if (dev.addr.empty())
        dev.addr = path_to_mac(p);

    if (patch.have_connected && !patch.connected)
    {
        auto it = impl_->links.find(p);
        if (it != impl_->links.end())
        {
            LOG_SYSTEM("[BLUEZ] link lost: %s", dev.addr.c_str());
            if (it->second)
                impl_->deferred.push_back(std::move(it->second));
            impl_->links.erase(it);
        }
        impl_->chars.erase(p);
    }

    if (!impl_->sink || !impl_->discovery_on.load())
        return;
    if (!added && !patch.have_rssi && !patch.have_mfr)
        return;  // connection/service state only, not an advertisement

    Advertisement adv;
    adv.addr    = dev.addr;
    adv.name    = dev.name;
    adv.rssi    = dev.have_rssi ? dev.rssi : 0;
    adv.payload = dev.mfr;

    const std::uint64_t gen  = impl_->scan_gen.load();
    OnAdvertisement     sink = impl_->sink;
    Impl               *impl = impl_.get();
    impl_->deferred.push_back([sink, adv, gen, impl] {
        // dropped if stop_async() ran since the signal was read
        if (impl->scan_gen.load() == gen)
            sink(adv);
    });
}

void BluezScanDriver::on_device_removed(const char *path)
{
    const std::string p(path);
    impl_->devices.erase(p);
    impl_->chars.erase(p);
    auto it = impl_->links.find(p);
    if (it != impl_->links.end())
    {
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> link lost %s", path);
        if (it->second)
            impl_->deferred.push_back(std::move(it->second));
        impl_->links.erase(it);
    }
}

void BluezScanDriver::on_char_value(const char *path, const std::uint8_t *data, std::size_t len)
{
    auto it = impl_->notify.find(path);
    if (it == impl_->notify.end() || !it->second)
        return;
    LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path, len);
    Bytes    value(data, data + len);
    OnNotify cb = it->second;
    impl_->deferred.push_back([cb, value] { cb(value); });
}

}  // namespace driver
