#include "ble_adapter.h"
#include "debug_utils.h"
#include <chrono>
#include <thread>

BluezAdapter::BluezAdapter(std::shared_ptr<BluezBus> bus)
    : m_bus(std::move(bus)) {}

// Device1 objects that belong to our adapter
std::vector<BleDeviceInfo> BluezAdapter::list_known_devices() {
    std::vector<BleDeviceInfo> devices;
    VariantPtr managed = m_bus->managed_objects(PenErrorKind::DiscoveryFailed);

    const std::string prefix = m_bus->adapter_path() + "/";

    GVariantIter iter;
    g_variant_iter_init(&iter, managed.get());

    const gchar* obj_path;
    GVariant* ifaces;

    while (g_variant_iter_next(&iter, "{&o@a{sa{sv}}}", &obj_path, &ifaces)) {
        std::string path_str(obj_path);
        GVariant* dev_props = g_variant_lookup_value(
            ifaces, "org.bluez.Device1", G_VARIANT_TYPE("a{sv}"));
        if (dev_props && path_str.rfind(prefix, 0) == 0) {
            const gchar* addr = nullptr;
            const gchar* name = nullptr;
            g_variant_lookup(dev_props, "Address", "&s", &addr);
            g_variant_lookup(dev_props, "Name", "&s", &name);

            if (addr) {
                BleDeviceInfo info;
                info.address = addr;
                info.name = name ? name : "";
                info.object_path = path_str;

                GVariant* uuids = g_variant_lookup_value(
                    dev_props, "UUIDs", G_VARIANT_TYPE("as"));
                if (uuids) {
                    GVariantIter uit;
                    g_variant_iter_init(&uit, uuids);
                    const gchar* u = nullptr;
                    while (g_variant_iter_next(&uit, "&s", &u)) {
                        info.uuids.push_back(to_lower(u));
                    }
                    g_variant_unref(uuids);
                }
                devices.push_back(std::move(info));
            }
        }
        if (dev_props) g_variant_unref(dev_props);
        g_variant_unref(ifaces);
    }

    return devices;
}

std::vector<BleDeviceInfo> BluezAdapter::scan(int duration_ms) {
    const std::string& adapter = m_bus->adapter_path();

    PLOG("adapter", "StartDiscovery on " << adapter << " for " << duration_ms << "ms");
    m_bus->call(adapter, "org.bluez.Adapter1", "StartDiscovery",
                nullptr, nullptr, 5000, PenErrorKind::DiscoveryFailed);

    // Give BlueZ some time to discover devices
    if (duration_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
    }

    std::vector<BleDeviceInfo> devices;
    try {
        devices = list_known_devices();
    } catch (const PenError&) {
        try {
            m_bus->call(adapter, "org.bluez.Adapter1", "StopDiscovery",
                        nullptr, nullptr, 5000, PenErrorKind::DiscoveryFailed);
        } catch (const PenError& stop_err) {
            PLOG("adapter", "StopDiscovery after failed listing: " << stop_err.what());
        }
        throw;
    }

    m_bus->call(adapter, "org.bluez.Adapter1", "StopDiscovery",
                nullptr, nullptr, 5000, PenErrorKind::DiscoveryFailed);

    PLOG("adapter", "scan found " << devices.size() << " device(s)");
    return devices;
}

BleDeviceInfo BluezAdapter::resolve(const std::string& address, int duration_ms) {
    const std::string wanted = to_lower(address);
    for (auto& d : scan(duration_ms)) {
        if (to_lower(d.address) == wanted) {
            return d;
        }
    }
    throw PenError(PenErrorKind::NoMatchingDevice,
                   "device " + address + " not seen during scan");
}
