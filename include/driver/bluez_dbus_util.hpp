// include/driver/bluez_dbus_util.hpp
#pragma once
#include "driver/bluez_scan_driver.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include "util/error.hpp"

#if BLUEST_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

static inline std::string to_lower_str(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static inline std::string to_upper_str(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

[[maybe_unused]] static inline bool ieq(const std::string &a, const std::string &b)
{
    return to_lower_str(a) == to_lower_str(b);
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF", "" if not a device path
[[maybe_unused]] static inline std::string path_to_mac(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return {};
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return to_upper_str(tail);
}

#if BLUEST_HAVE_SDBUS
// Map an sd-bus failure onto our error kinds.
[[maybe_unused]] static inline bluest::Error bus_error(int r, const sd_bus_error *e, const char *what)
{
    const char *ename = (e && e->name) ? e->name : "";
    const char *emsg  = (e && e->message) ? e->message : strerror(-r);

    const bool denied = r == -EACCES || r == -EPERM ||
                        std::strcmp(ename, "org.bluez.Error.NotAuthorized") == 0 ||
                        std::strcmp(ename, "org.bluez.Error.NotPermitted") == 0 ||
                        std::strcmp(ename, "org.freedesktop.DBus.Error.AccessDenied") == 0;
    std::string msg = std::string(what) + " failed: " + emsg;
    if (*ename)
        msg += std::string(" [") + ename + "]";
    return bluest::make_error(denied ? bluest::Errc::permission_denied
                                     : bluest::Errc::driver_failure,
                              std::move(msg), r);
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// read variant "a{qv}" (ManufacturerData); keeps the first entry as [id lo][id hi][data...]
[[maybe_unused]] static inline int read_var_mfr(sd_bus_message *m, driver::Bytes &out, bool &have)
{
    have  = false;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{qv}");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0)
    {
        uint16_t company = 0;
        if ((r = sd_bus_message_read(m, "q", &company)) < 0)
            return r;
        if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0)
            return r;
        const void *buf = nullptr;
        size_t      len = 0;
        if ((r = sd_bus_message_read_array(m, 'y', &buf, &len)) < 0)
            return r;
        if (!have)
        {
            const auto *p = static_cast<const uint8_t *>(buf);
            out.clear();
            out.push_back(static_cast<uint8_t>(company & 0xFF));
            out.push_back(static_cast<uint8_t>(company >> 8));
            if (p && len)
                out.insert(out.end(), p, p + len);
            have = true;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)  // variant
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)  // dict-entry
            return r;
    }
    if (r < 0)
        return r;
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0) ? r1 : r2;
}
#endif
