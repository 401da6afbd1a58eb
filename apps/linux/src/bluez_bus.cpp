#include "bluez_bus.h"
#include "debug_utils.h"
#include <algorithm>
#include <cctype>

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

static std::string dbus_error_name(const GError* error) {
    std::string name;
    if (g_dbus_error_is_remote_error(error)) {
        gchar* remote = g_dbus_error_get_remote_error(error);
        if (remote) {
            name = remote;
            g_free(remote);
        }
    } else if (g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED)) {
        name = "org.freedesktop.DBus.Error.AccessDenied";
    }
    return name;
}

static PenErrorKind classify_gerror(const GError* error, PenErrorKind fail_kind) {
    if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_TIMED_OUT) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_TIMEOUT) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_NO_REPLY)) {
        return PenErrorKind::ProtocolTimeout;
    }
    if (g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_OBJECT) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_METHOD)) {
        return PenErrorKind::ConnectionDropped;
    }

    const std::string remote = dbus_error_name(error);
    if (remote == "org.bluez.Error.NotConnected") {
        return PenErrorKind::ConnectionDropped;
    }
    if (remote == "org.bluez.Error.NotReady" &&
        fail_kind != PenErrorKind::ConnectFailed) {
        return PenErrorKind::RadioUnavailable;
    }
    return fail_kind;
}

BluezBus::BluezBus(const std::string& adapter_name)
    : m_adapter_path("/org/bluez/" + adapter_name) {

    GError* error = nullptr;
    m_conn = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &error);
    if (!m_conn) {
        m_open_error = error ? error->message : "unknown";
        PLOG("bluez", "failed to connect to system D-Bus: " << m_open_error);
        if (error) g_error_free(error);
        return;
    }

    m_loop = g_main_loop_new(nullptr, FALSE);
    m_loop_thread = std::thread([this]() {
        g_main_loop_run(m_loop);
    });
}

BluezBus::~BluezBus() {
    if (m_loop) {
        g_main_loop_quit(m_loop);
        if (m_loop_thread.joinable()) {
            m_loop_thread.join();
        }
        g_main_loop_unref(m_loop);
        m_loop = nullptr;
    }
    if (m_conn) {
        g_object_unref(m_conn);
        m_conn = nullptr;
    }
}

void BluezBus::require_open() const {
    if (!m_conn) {
        throw PenError(PenErrorKind::RadioUnavailable,
                       "system D-Bus unavailable: " + m_open_error);
    }
}

VariantPtr BluezBus::call(const std::string& object_path,
                          const char* iface,
                          const char* method,
                          GVariant* params,
                          const GVariantType* reply_type,
                          int timeout_ms,
                          PenErrorKind fail_kind) {
    if (!m_conn) {
        if (params) {
            // take and drop the floating reference
            g_variant_unref(g_variant_ref_sink(params));
        }
        require_open();
    }

    GError* error = nullptr;
    GVariant* result = g_dbus_connection_call_sync(
        m_conn,
        "org.bluez",
        object_path.c_str(),
        iface,
        method,
        params,
        reply_type,
        G_DBUS_CALL_FLAGS_NONE,
        timeout_ms,
        nullptr,
        &error
    );
    if (!result) {
        std::string msg = std::string(method) + " on " + object_path + " failed: " +
                          (error ? error->message : "unknown");
        PenErrorKind kind = error ? classify_gerror(error, fail_kind) : fail_kind;
        std::string name = error ? dbus_error_name(error) : std::string();
        if (error) g_error_free(error);
        throw PenError(kind, msg, name);
    }
    return VariantPtr(result);
}

VariantPtr BluezBus::managed_objects(PenErrorKind fail_kind) {
    GError* error = nullptr;
    require_open();
    GVariant* tuple = g_dbus_connection_call_sync(
        m_conn,
        "org.bluez",
        "/",
        "org.freedesktop.DBus.ObjectManager",
        "GetManagedObjects",
        nullptr,
        G_VARIANT_TYPE("(a{oa{sa{sv}}})"),
        G_DBUS_CALL_FLAGS_NONE,
        5000,
        nullptr,
        &error
    );
    if (!tuple) {
        std::string msg = std::string("GetManagedObjects failed: ") +
                          (error ? error->message : "unknown");
        PenErrorKind kind = error ? classify_gerror(error, fail_kind) : fail_kind;
        std::string name = error ? dbus_error_name(error) : std::string();
        if (error) g_error_free(error);
        // BlueZ not running on the bus at all
        if (kind == PenErrorKind::ConnectionDropped) {
            kind = PenErrorKind::RadioUnavailable;
        }
        throw PenError(kind, msg, name);
    }

    GVariant* dict = g_variant_get_child_value(tuple, 0);
    g_variant_unref(tuple);
    return VariantPtr(dict);
}

VariantPtr BluezBus::get_property(const std::string& object_path,
                                  const char* iface,
                                  const char* prop,
                                  int timeout_ms,
                                  PenErrorKind fail_kind) {
    VariantPtr result = call(object_path,
                             "org.freedesktop.DBus.Properties",
                             "Get",
                             g_variant_new("(ss)", iface, prop),
                             G_VARIANT_TYPE("(v)"),
                             timeout_ms,
                             fail_kind);
    GVariant* v = nullptr;
    g_variant_get(result.get(), "(v)", &v);
    return VariantPtr(v);
}

bool BluezBus::get_bool_property(const std::string& object_path,
                                 const char* iface,
                                 const char* prop,
                                 int timeout_ms,
                                 PenErrorKind fail_kind) {
    VariantPtr v = get_property(object_path, iface, prop, timeout_ms, fail_kind);
    if (!g_variant_is_of_type(v.get(), G_VARIANT_TYPE_BOOLEAN)) {
        throw PenError(PenErrorKind::ProtocolError,
                       std::string(prop) + " on " + object_path + " is not a boolean");
    }
    return g_variant_get_boolean(v.get()) != FALSE;
}

void BluezBus::set_property(const std::string& object_path,
                            const char* iface,
                            const char* prop,
                            GVariant* value,
                            int timeout_ms,
                            PenErrorKind fail_kind) {
    call(object_path,
         "org.freedesktop.DBus.Properties",
         "Set",
         g_variant_new("(ssv)", iface, prop, value),
         nullptr,
         timeout_ms,
         fail_kind);
}
