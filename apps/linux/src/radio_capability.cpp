#include "radio_capability.h"
#include "debug_utils.h"

const char* to_string(RadioState state) {
    switch (state) {
    case RadioState::Ok:          return "ok";
    case RadioState::Unavailable: return "unavailable";
    case RadioState::Denied:      return "denied";
    }
    return "unknown";
}

RadioState radio_state_for(const PenError& e) {
    static const char* const kDeniedNames[] = {
        "org.freedesktop.DBus.Error.AccessDenied",
        "org.bluez.Error.NotPermitted",
        "org.bluez.Error.NotAuthorized",
        "org.bluez.Error.Blocked",
    };
    for (const char* name : kDeniedNames) {
        if (e.dbus_error() == name) {
            return RadioState::Denied;
        }
    }
    return RadioState::Unavailable;
}

BluezAdapterPower::BluezAdapterPower(std::shared_ptr<BluezBus> bus)
    : m_bus(std::move(bus)) {}

RadioState BluezAdapterPower::enable() {
    if (!m_bus->is_open()) {
        return RadioState::Unavailable;
    }

    const std::string& adapter = m_bus->adapter_path();
    try {
        if (m_bus->get_bool_property(adapter, "org.bluez.Adapter1", "Powered",
                                     2000, PenErrorKind::RadioUnavailable)) {
            return RadioState::Ok;
        }

        PLOG("radio", "adapter " << adapter << " is off, powering on");
        m_bus->set_property(adapter, "org.bluez.Adapter1", "Powered",
                            g_variant_new_boolean(TRUE), 5000,
                            PenErrorKind::RadioUnavailable);

        if (m_bus->get_bool_property(adapter, "org.bluez.Adapter1", "Powered",
                                     2000, PenErrorKind::RadioUnavailable)) {
            return RadioState::Ok;
        }
        // rfkill keeps Powered false without reporting an error
        return RadioState::Denied;
    } catch (const PenError& e) {
        PLOG("radio", "power check failed: " << e.what());
        return radio_state_for(e);
    }
}

BluezStackProbe::BluezStackProbe(std::shared_ptr<BluezBus> bus)
    : m_bus(std::move(bus)) {}

RadioState BluezStackProbe::enable() {
    if (!m_bus->is_open()) {
        return RadioState::Unavailable;
    }

    try {
        VariantPtr managed = m_bus->managed_objects(PenErrorKind::RadioUnavailable);
        GVariant* ifaces = g_variant_lookup_value(
            managed.get(), m_bus->adapter_path().c_str(), G_VARIANT_TYPE("a{sa{sv}}"));
        if (!ifaces) {
            PLOG("radio", "no adapter object at " << m_bus->adapter_path());
            return RadioState::Unavailable;
        }
        GVariant* adapter = g_variant_lookup_value(
            ifaces, "org.bluez.Adapter1", G_VARIANT_TYPE("a{sv}"));
        g_variant_unref(ifaces);
        if (!adapter) {
            return RadioState::Unavailable;
        }
        g_variant_unref(adapter);
        return RadioState::Ok;
    } catch (const PenError& e) {
        PLOG("radio", "stack probe failed: " << e.what());
        return RadioState::Unavailable;
    }
}
