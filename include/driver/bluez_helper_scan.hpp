// include/driver/bluez_helper_scan.hpp
#pragma once

#if BLUEST_HAVE_SDBUS
#include <functional>
#include <string>
#include <systemd/sd-bus.h>

#include "driver/bluez_scan_driver.hpp"

namespace driver
{

// DBus signal callbacks, userdata is the BluezScanDriver
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
// async method reply, userdata is a PendingCall
int bluez_on_method_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// Read an a{sv} of org.bluez.Device1 properties (InterfacesAdded, GetManagedObjects
// and PropertiesChanged all carry the same shape).
int parse_device1_props(sd_bus_message *m, DeviceProps &out);

// Walk the a{oa{sa{sv}}} reply of GetManagedObjects for objects under `prefix`.
// visit() must consume the a{sv} and return >= 0, or return 0 without reading to skip it.
using IfaceVisitor =
    std::function<int(const std::string &path, const char *iface, sd_bus_message *m, bool &consumed)>;
int walk_managed_objects(sd_bus_message *reply, const std::string &prefix, const IfaceVisitor &visit);

}  // namespace driver
#endif  // BLUEST_HAVE_SDBUS
