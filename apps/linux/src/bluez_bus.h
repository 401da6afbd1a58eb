#pragma once
#include "pen_error.h"
#include <gio/gio.h>
#include <memory>
#include <string>
#include <thread>

struct VariantUnref {
    void operator()(GVariant* v) const {
        if (v) g_variant_unref(v);
    }
};
using VariantPtr = std::unique_ptr<GVariant, VariantUnref>;

std::string to_lower(std::string s);

// System bus connection to BlueZ plus the GLib main loop thread that
// dispatches D-Bus signals. Shared by the adapter, the session and the
// radio capability probes.
class BluezBus {
public:
    explicit BluezBus(const std::string& adapter_name = "hci0");
    ~BluezBus();

    BluezBus(const BluezBus&) = delete;
    BluezBus& operator=(const BluezBus&) = delete;

    bool is_open() const { return m_conn != nullptr; }
    GDBusConnection* connection() const { return m_conn; }
    const std::string& adapter_path() const { return m_adapter_path; }
    const std::string& open_error() const { return m_open_error; }

    // Synchronous BlueZ method call. 'params' is consumed (floating ref).
    // GErrors become PenError: timeouts map to ProtocolTimeout, vanished
    // objects and NotConnected to ConnectionDropped, the rest to 'fail_kind'.
    VariantPtr call(const std::string& object_path,
                    const char* iface,
                    const char* method,
                    GVariant* params,
                    const GVariantType* reply_type,
                    int timeout_ms,
                    PenErrorKind fail_kind);

    // ObjectManager.GetManagedObjects, returns the a{oa{sa{sv}}} dict
    VariantPtr managed_objects(PenErrorKind fail_kind);

    // Properties.Get, returns the unboxed value
    VariantPtr get_property(const std::string& object_path,
                            const char* iface,
                            const char* prop,
                            int timeout_ms,
                            PenErrorKind fail_kind);

    bool get_bool_property(const std::string& object_path,
                           const char* iface,
                           const char* prop,
                           int timeout_ms,
                           PenErrorKind fail_kind);

    void set_property(const std::string& object_path,
                      const char* iface,
                      const char* prop,
                      GVariant* value,
                      int timeout_ms,
                      PenErrorKind fail_kind);

private:
    void require_open() const;

    GDBusConnection* m_conn = nullptr;
    std::string m_adapter_path;
    std::string m_open_error;

    GMainLoop* m_loop = nullptr;
    std::thread m_loop_thread;
};
