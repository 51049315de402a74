/* ======================================================================
 * BlueZ scan driver: connection and GATT path
 *
 *  Node                                   sd-bus                           BlueZ
 *  ----                                   ------                           -----
 *  connect(addr, on_lost)
 *    └─ call_and_wait ─────────────────────────────────────────────────▶ Device1.Connect
 *    └─ wait_services_resolved ───────────────────────────────────────▶ Device1.ServicesResolved
 *  list_characteristics(addr)
 *    └─ GetManagedObjects, GattCharacteristic1 under dev path ───────▶ ObjectManager
 *  start_notify(addr, uuid, cb)
 *    └─ resolve_char_path, register cb ───────────────────────────────▶ GattCharacteristic1.StartNotify
 *                                         ◀── on_char_value (Value changed) ── cb(bytes) from process()
 *  disconnect(addr)
 *    └─ drop link/notify state ───────────────────────────────────────▶ Device1.Disconnect
 *
 *  Notes
 *    └─ Method calls are async so the bus keeps dispatching signals while waiting
 *    └─ on_lost fires from process() when Connected turns false or the device vanishes
 * ====================================================================== */

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
#endif

namespace driver
{

namespace
{
constexpr std::chrono::milliseconds CALL_POLL{50};
constexpr std::chrono::milliseconds RESOLVE_TIMEOUT{10000};

const std::chrono::milliseconds CALL_TIMEOUT =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::microseconds(constants::BUS_CALL_TIMEOUT_USEC));

#if !BLUEST_HAVE_SDBUS
bool no_sdbus(bluest::Error &err)
{
    err = bluest::make_error(bluest::Errc::driver_failure,
                             "built without sd-bus (BLUEST_HAVE_SDBUS=0)");
    return false;
}
#endif
}  // namespace

// ======================================================================
// Function: BluezScanDriver::call_and_wait
// - In: bus open, bus_mu NOT held
// - Out: true when the method returned without error before `timeout`
// - Note: pumps the bus while waiting so signals and deferred callbacks keep flowing
// ======================================================================
bool BluezScanDriver::call_and_wait(const std::string        &path,
                                    const char               *iface,
                                    const char               *method,
                                    std::chrono::milliseconds timeout,
                                    bluest::Error            &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)path;
    (void)iface;
    (void)method;
    (void)timeout;
    return no_sdbus(err);
#else
    PendingCall  call;
    sd_bus_slot *slot = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        int r = sd_bus_call_method_async(impl_->bus, &slot, "org.bluez", path.c_str(), iface,
                                         method, bluez_on_method_reply, &call, "");
        if (r < 0)
        {
            err = bus_error(r, nullptr, method);
            return false;
        }
    }

    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout;
    bool       ok       = true;
    while (!call.done.load() && ok)
    {
        if (steady_clock::now() >= deadline)
            break;
        ok = pump(CALL_POLL, err);
    }

    {
        // the reply handler points at `call`, the slot must die before it does
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(slot);
    }
    if (!ok)
        return false;
    if (!call.done.load())
    {
        err = bluest::make_error(bluest::Errc::driver_failure,
                                 std::string(method) + " timed out on " + path, -ETIMEDOUT);
        return false;
    }
    if (call.r < 0)
    {
        sd_bus_error e{};
        e.name    = call.ename.c_str();
        e.message = call.emsg.c_str();
        err       = bus_error(call.r, &e, method);
        return false;
    }
    return true;
#endif
}

// ======================================================================
// Function: BluezScanDriver::wait_services_resolved
// - In: device connected, bus_mu NOT held
// - Out: true once Device1.ServicesResolved reads true
// ======================================================================
bool BluezScanDriver::wait_services_resolved(const std::string        &dev_path,
                                             std::chrono::milliseconds timeout)
{
#if !BLUEST_HAVE_SDBUS
    (void)dev_path;
    (void)timeout;
    return false;
#else
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline)
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            auto                        it = impl_->devices.find(dev_path);
            if (it != impl_->devices.end() && it->second.have_resolved &&
                it->second.services_resolved)
                return true;

            sd_bus_error err{};
            int          val = 0;
            int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", dev_path.c_str(),
                                                "org.bluez.Device1", "ServicesResolved", &err,
                                                'b', &val);
            sd_bus_error_free(&err);
            if (r >= 0 && val)
            {
                impl_->devices[dev_path].services_resolved = true;
                impl_->devices[dev_path].have_resolved     = true;
                return true;
            }
        }
        bluest::Error perr;
        if (!pump(CALL_POLL * 2, perr))
        {
            LOG_WARN("[BLUEZ] %s", perr.message.c_str());
            return false;
        }
    }
    return false;
#endif
}

bool BluezScanDriver::connect(const std::string &addr, OnLinkLost on_lost, bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)addr;
    (void)on_lost;
    return no_sdbus(err);
#else
    if (!open_bus(err))
        return false;
    const std::string dev_path = device_path(addr);

    LOG_INFO("[BLUEZ] connecting to %s", addr.c_str());
    bluest::Error call_err;
    if (!call_and_wait(dev_path, "org.bluez.Device1", "Connect", CALL_TIMEOUT, call_err))
    {
        if (call_err.message.find("org.bluez.Error.AlreadyConnected") == std::string::npos)
        {
            err = call_err;
            LOG_ERROR("[BLUEZ] %s", err.message.c_str());
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->links[dev_path]                    = std::move(on_lost);
        impl_->devices[dev_path].connected        = true;
        impl_->devices[dev_path].have_connected   = true;
        if (impl_->devices[dev_path].addr.empty())
            impl_->devices[dev_path].addr = to_upper_str(addr);
    }

    if (!wait_services_resolved(dev_path, RESOLVE_TIMEOUT))
        LOG_WARN("[BLUEZ] services of %s not resolved yet, characteristics may be missing",
                 addr.c_str());
    LOG_SYSTEM("[BLUEZ] connected: %s", addr.c_str());
    return true;
#endif
}

bool BluezScanDriver::disconnect(const std::string &addr, bluest::Error &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)addr;
    return no_sdbus(err);
#else
    if (!open_bus(err))
        return false;
    const std::string dev_path = device_path(addr);
    {
        // an asked-for disconnect is not a lost link
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->links.erase(dev_path);
        impl_->chars.erase(dev_path);
        const std::string prefix = dev_path + "/";
        for (auto it = impl_->notify.begin(); it != impl_->notify.end();)
        {
            if (it->first.rfind(prefix, 0) == 0)
                it = impl_->notify.erase(it);
            else
                ++it;
        }
    }
    if (!call_and_wait(dev_path, "org.bluez.Device1", "Disconnect", CALL_TIMEOUT, err))
    {
        LOG_WARN("[BLUEZ] %s", err.message.c_str());
        return false;
    }
    LOG_SYSTEM("[BLUEZ] disconnected: %s", addr.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezScanDriver::list_characteristics
// - In: device connected through this driver
// - Out: lowercase UUIDs of every GattCharacteristic1 below the device
// - Note: refreshes the uuid -> object path cache used by start/stop_notify
// ======================================================================
bool BluezScanDriver::list_characteristics(const std::string        &addr,
                                           std::vector<std::string> &uuids,
                                           bluest::Error            &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)addr;
    (void)uuids;
    return no_sdbus(err);
#else
    if (!open_bus(err))
        return false;
    const std::string dev_path = device_path(addr);

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->links.count(dev_path))
    {
        err = bluest::make_error(bluest::Errc::not_connected, addr + " is not connected");
        return false;
    }

    sd_bus_message *reply = nullptr;
    sd_bus_error    berr{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &berr, &reply, "");
    if (r < 0)
    {
        err = bus_error(r, &berr, "GetManagedObjects");
        sd_bus_error_free(&berr);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    std::map<std::string, std::string> found;  // uuid -> char path
    r = walk_managed_objects(
        reply, dev_path + "/",
        [&](const std::string &path, const char *iface, sd_bus_message *m, bool &consumed) -> int {
            if (!iface || std::strcmp(iface, "org.bluez.GattCharacteristic1") != 0)
                return 0;
            consumed = true;

            // --- Characteristic properties (looking for "UUID")
            std::string uuid;
            int         rr = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
            if (rr < 0)
                return rr;
            while ((rr = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((rr = sd_bus_message_read(m, "s", &key)) < 0)
                    return rr;
                if (key && std::strcmp(key, "UUID") == 0)
                    rr = read_var_s(m, uuid);
                else
                    rr = sd_bus_message_skip(m, "v");
                if (rr < 0)
                    return rr;
                if ((rr = sd_bus_message_exit_container(m)) < 0)
                    return rr;
            }
            if (rr < 0)
                return rr;
            if (!uuid.empty())
                found[to_lower_str(uuid)] = path;
            return sd_bus_message_exit_container(m);  // a{sv}
        });

    sd_bus_message_unref(reply);
    sd_bus_error_free(&berr);
    if (r < 0)
    {
        err = bus_error(r, nullptr, "walk GetManagedObjects");
        return false;
    }

    uuids.clear();
    for (const auto &kv : found)
        uuids.push_back(kv.first);
    impl_->chars[dev_path] = std::move(found);
    LOG_DEBUG("[BLUEZ] %s exposes %zu characteristics", addr.c_str(), uuids.size());
    return true;
#endif
}

bool BluezScanDriver::resolve_char_path(const std::string &addr,
                                        const std::string &uuid,
                                        std::string       &path,
                                        bluest::Error     &err)
{
    const std::string dev_path = device_path(addr);
    const std::string want     = to_lower_str(uuid);
    for (int pass = 0; pass < 2; ++pass)
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            auto                        dev = impl_->chars.find(dev_path);
            if (dev != impl_->chars.end())
            {
                auto c = dev->second.find(want);
                if (c != dev->second.end())
                {
                    path = c->second;
                    return true;
                }
            }
        }
        if (pass == 0)
        {
            std::vector<std::string> ignored;
            if (!list_characteristics(addr, ignored, err))
                return false;
        }
    }
    err = bluest::make_error(bluest::Errc::not_found,
                             "characteristic " + uuid + " not found on " + addr);
    return false;
}

bool BluezScanDriver::start_notify(const std::string &addr,
                                   const std::string &char_uuid,
                                   OnNotify           cb,
                                   bluest::Error     &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)addr;
    (void)char_uuid;
    (void)cb;
    return no_sdbus(err);
#else
    std::string path;
    if (!resolve_char_path(addr, char_uuid, path, err))
        return false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->notify[path] = std::move(cb);
    }
    if (!call_and_wait(path, "org.bluez.GattCharacteristic1", "StartNotify", CALL_TIMEOUT, err))
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->notify.erase(path);
        LOG_WARN("[BLUEZ] %s", err.message.c_str());
        return false;
    }
    LOG_INFO("[BLUEZ] notifications on for %s (%s)", char_uuid.c_str(), addr.c_str());
    return true;
#endif
}

bool BluezScanDriver::stop_notify(const std::string &addr,
                                  const std::string &char_uuid,
                                  bluest::Error     &err)
{
#if !BLUEST_HAVE_SDBUS
    (void)addr;
    (void)char_uuid;
    return no_sdbus(err);
#else
    std::string path;
    if (!resolve_char_path(addr, char_uuid, path, err))
        return false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->notify.erase(path);
    }
    if (!call_and_wait(path, "org.bluez.GattCharacteristic1", "StopNotify", CALL_TIMEOUT, err))
    {
        LOG_WARN("[BLUEZ] %s", err.message.c_str());
        return false;
    }
    LOG_INFO("[BLUEZ] notifications off for %s (%s)", char_uuid.c_str(), addr.c_str());
    return true;
#endif
}

}  // namespace driver
