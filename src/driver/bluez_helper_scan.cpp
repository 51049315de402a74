// src/driver/bluez_helper_scan.cpp
#include "driver/bluez_helper_scan.hpp"
#include "driver/bluez_dbus_util.hpp"
#include "driver/bluez_scan_driver.hpp"
#include "driver/bluez_scan_driver_impl.hpp"

#include <cstring>
#include <string>

#include "util/log.hpp"

#if BLUEST_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace driver
{

int parse_device1_props(sd_bus_message *m, DeviceProps &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    std::string alias;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && strcmp(key, "Address") == 0)
        {
            if ((r = read_var_s(m, out.addr)) < 0)
                return r;
        }
        else if (key && strcmp(key, "Name") == 0)
        {
            if ((r = read_var_s(m, out.name)) < 0)
                return r;
            out.have_name = true;
        }
        else if (key && strcmp(key, "Alias") == 0)
        {
            if ((r = read_var_s(m, alias)) < 0)
                return r;
        }
        else if (key && strcmp(key, "RSSI") == 0)
        {
            if ((r = read_var_i16(m, out.rssi)) < 0)
                return r;
            out.have_rssi = true;
        }
        else if (key && strcmp(key, "ManufacturerData") == 0)
        {
            if ((r = read_var_mfr(m, out.mfr, out.have_mfr)) < 0)
                return r;
        }
        else if (key && strcmp(key, "Connected") == 0)
        {
            if ((r = read_var_b(m, out.connected)) < 0)
                return r;
            out.have_connected = true;
        }
        else if (key && strcmp(key, "ServicesResolved") == 0)
        {
            if ((r = read_var_b(m, out.services_resolved)) < 0)
                return r;
            out.have_resolved = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;

    // BlueZ falls back to the address for Alias; only use it when there is no Name
    if (!out.have_name && !alias.empty() && alias != out.addr &&
        to_upper_str(alias) != to_upper_str(out.addr) &&
        alias.find('-') == std::string::npos)
    {
        out.name      = alias;
        out.have_name = true;
    }
    return sd_bus_message_exit_container(m);  // a{sv}
}

int walk_managed_objects(sd_bus_message *reply, const std::string &prefix, const IfaceVisitor &visit)
{
    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            return r;
        if (!obj)
            return -EINVAL;

        const std::string path(obj);
        if (path.rfind(prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                return r;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                return r;
            continue;
        }

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            return r;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                return r;

            bool consumed = false;
            if ((r = visit(path, iface, reply, consumed)) < 0)
                return r;
            if (!consumed && (r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                return r;

            if ((r = sd_bus_message_exit_container(reply)) < 0)
                return r;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            return r;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            return r;  // {oa{sa{sv}}}
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(reply);
}

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezScanDriver *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = "/org/bluez/" + self->config().adapter + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0 || path_to_mac(obj_path).empty())
        return 0;  // not a device object (adapter, services, characteristics)

    DeviceProps props;
    bool        is_device = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
        {
            if ((r = parse_device1_props(m, props)) < 0)
                return r;
            is_device = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (is_device)
        self->on_device_props(obj, props, /*added=*/true);
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezScanDriver *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    if (!path_to_mac(obj).empty())
        self->on_device_removed(obj);
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<BluezScanDriver *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    const char *path = sd_bus_message_get_path(m);
    if (!path || !iface)
        return 0;

    if (strcmp(iface, "org.bluez.Device1") == 0)
    {
        if (path_to_mac(path).empty())
            return 0;
        DeviceProps patch;
        if ((r = parse_device1_props(m, patch)) < 0)
            return r;
        self->on_device_props(path, patch, /*added=*/false);
        return 0;
    }

    if (strcmp(iface, "org.bluez.GattCharacteristic1") != 0)
        return 0;

    bool        value_hit = false;
    const void *val_buf   = nullptr;
    size_t      val_len   = 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read(m, "s", &key);
        if (r < 0)
            return r;

        if (key && strcmp(key, "Value") == 0)
        {
            r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
            if (r < 0)
                return r;
            r = sd_bus_message_read_array(m, 'y', &val_buf, &val_len);
            if (r < 0)
                return r;
            value_hit = true;
            r         = sd_bus_message_exit_container(m);
            if (r < 0)
                return r;
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
            if (r < 0)
                return r;
        }
        r = sd_bus_message_exit_container(m);
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;

    // val_buf points into m, hand it over before the message goes away
    if (value_hit && val_buf && val_len)
        self->on_char_value(path, static_cast<const uint8_t *>(val_buf), val_len);
    return 0;
}

int bluez_on_method_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *call = static_cast<PendingCall *>(userdata);

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        call->ename           = (e && e->name) ? e->name : "unknown";
        call->emsg            = (e && e->message) ? e->message : "no message";
        call->r               = -sd_bus_message_get_errno(m);
        if (call->r == 0)
            call->r = -EIO;
    }
    else
    {
        call->r = 0;
    }
    call->done.store(true);
    return 1;
}

}  // namespace driver

#endif
