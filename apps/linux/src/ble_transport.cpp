#include "ble_transport.h"
#include "debug_utils.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace {
    // Clears the in-progress flag however receive() leaves
    struct ReceiveGuard {
        std::atomic<bool>& flag;
        ~ReceiveGuard() { flag.store(false); }
    };
}

bool BleTransport::CharInfo::has_flag(const char* f) const {
    return std::find(flags.begin(), flags.end(), f) != flags.end();
}

BleTransport::BleTransport(std::shared_ptr<BluezBus> bus)
    : m_bus(std::move(bus)) {}

BleTransport::~BleTransport() {
    disconnect();
}

void BleTransport::connect(const BleDeviceInfo& peer) {
    if (!m_device_path.empty()) {
        // Never two links at once
        disconnect();
    }
    if (peer.object_path.empty()) {
        throw PenError(PenErrorKind::ConnectFailed,
                       "no BlueZ object for " + peer.address);
    }

    PLOG("session", "Device.Connect " << peer.address << " (" << peer.name << ")");
    bool connected = false;
    try {
        m_bus->call(peer.object_path, "org.bluez.Device1", "Connect",
                    nullptr, nullptr, kConnectTimeoutMs, PenErrorKind::ConnectFailed);

        // The pen sometimes accepts and immediately drops the link
        std::this_thread::sleep_for(std::chrono::milliseconds(kSettleMs));

        connected = m_bus->get_bool_property(peer.object_path, "org.bluez.Device1",
                                             "Connected", 2000,
                                             PenErrorKind::ConnectFailed);
    } catch (const PenError& e) {
        // A timed out Connect may still complete inside BlueZ later
        abort_connect(peer);
        throw PenError(PenErrorKind::ConnectFailed,
                       "connect " + peer.address + ": " + e.what(), e.dbus_error());
    }
    if (!connected) {
        abort_connect(peer);
        throw PenError(PenErrorKind::ConnectFailed,
                       peer.address + " dropped right after connect");
    }

    m_device_path = peer.object_path;
    m_address = peer.address;
    PLOG("session", "connected " << m_address << " at " << m_device_path);
}

void BleTransport::abort_connect(const BleDeviceInfo& peer) {
    try {
        m_bus->call(peer.object_path, "org.bluez.Device1", "Disconnect",
                    nullptr, nullptr, 5000, PenErrorKind::ConnectFailed);
    } catch (const PenError& e) {
        PLOG("session", "Device.Disconnect after failed connect: " << e.what());
    }
}

void BleTransport::listen(const std::string& service_uuid,
                          const std::string& char_uuid) {
    require_connected("listen");
    wait_services_resolved();
    ensure_listener(find_characteristic(service_uuid, char_uuid));
}

bool BleTransport::is_alive() {
    if (m_device_path.empty()) {
        return false;
    }
    try {
        return m_bus->get_bool_property(m_device_path, "org.bluez.Device1",
                                        "Connected", 2000,
                                        PenErrorKind::ConnectionDropped);
    } catch (const PenError& e) {
        PLOG("session", "liveness check failed: " << e.what());
        return false;
    }
}

void BleTransport::require_connected(const char* op) const {
    if (m_device_path.empty()) {
        throw PenError(PenErrorKind::ConnectionDropped,
                       std::string(op) + ": not connected");
    }
}

void BleTransport::wait_services_resolved() {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (m_bus->get_bool_property(m_device_path, "org.bluez.Device1",
                                     "ServicesResolved", 2000,
                                     PenErrorKind::ProtocolError)) {
            return;
        }
        // Drop out early if the link went away while resolving
        if (!m_bus->get_bool_property(m_device_path, "org.bluez.Device1",
                                      "Connected", 2000,
                                      PenErrorKind::ConnectionDropped)) {
            throw PenError(PenErrorKind::ConnectionDropped,
                           m_address + " disconnected during service discovery");
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed >= kServicesResolvedMs) {
            throw PenError(PenErrorKind::ProtocolTimeout,
                           "service discovery timed out on " + m_address);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

BleTransport::CharInfo BleTransport::find_characteristic(const std::string& service_uuid,
                                                         const std::string& char_uuid) {
    const std::string want_svc  = to_lower(service_uuid);
    const std::string want_char = to_lower(char_uuid);

    VariantPtr managed = m_bus->managed_objects(PenErrorKind::ProtocolError);

    // First pass: the service object, second pass: its characteristic
    std::string service_path;
    GVariantIter iter;
    const gchar* obj_path;
    GVariant* ifaces;

    g_variant_iter_init(&iter, managed.get());
    while (g_variant_iter_next(&iter, "{&o@a{sa{sv}}}", &obj_path, &ifaces)) {
        std::string path_str(obj_path);
        if (service_path.empty() && path_str.rfind(m_device_path + "/", 0) == 0) {
            GVariant* svc = g_variant_lookup_value(
                ifaces, "org.bluez.GattService1", G_VARIANT_TYPE("a{sv}"));
            if (svc) {
                const gchar* uuid = nullptr;
                g_variant_lookup(svc, "UUID", "&s", &uuid);
                if (uuid && to_lower(uuid) == want_svc) {
                    service_path = path_str;
                }
                g_variant_unref(svc);
            }
        }
        g_variant_unref(ifaces);
    }

    if (service_path.empty()) {
        throw PenError(PenErrorKind::ProtocolError,
                       "service " + want_svc + " not found on " + m_address);
    }

    CharInfo found;
    g_variant_iter_init(&iter, managed.get());
    while (g_variant_iter_next(&iter, "{&o@a{sa{sv}}}", &obj_path, &ifaces)) {
        GVariant* ch = g_variant_lookup_value(
            ifaces, "org.bluez.GattCharacteristic1", G_VARIANT_TYPE("a{sv}"));
        if (ch && found.path.empty()) {
            const gchar* uuid = nullptr;
            const gchar* svc = nullptr;
            g_variant_lookup(ch, "UUID", "&s", &uuid);
            g_variant_lookup(ch, "Service", "&o", &svc);
            if (uuid && svc && service_path == svc && to_lower(uuid) == want_char) {
                found.path = obj_path;
                GVariant* flags = g_variant_lookup_value(ch, "Flags", G_VARIANT_TYPE("as"));
                if (flags) {
                    GVariantIter fit;
                    g_variant_iter_init(&fit, flags);
                    const gchar* f = nullptr;
                    while (g_variant_iter_next(&fit, "&s", &f)) {
                        found.flags.emplace_back(f);
                    }
                    g_variant_unref(flags);
                }
            }
        }
        if (ch) g_variant_unref(ch);
        g_variant_unref(ifaces);
    }

    if (found.path.empty()) {
        throw PenError(PenErrorKind::ProtocolError,
                       "characteristic " + want_char + " not found on " + m_address);
    }
    return found;
}

void BleTransport::send(const std::string& service_uuid,
                        const std::string& char_uuid,
                        const std::vector<uint8_t>& data) {
    require_connected("send");
    wait_services_resolved();

    CharInfo ch = find_characteristic(service_uuid, char_uuid);
    const bool no_ack = ch.has_flag("write-without-response");
    if (!no_ack && !ch.has_flag("write")) {
        throw PenError(PenErrorKind::ProtocolError,
                       "characteristic " + char_uuid + " is not writable");
    }

    // The reply may arrive before WriteValue returns
    ensure_listener(ch);

    // Stale notifications would be mistaken for the reply to this command
    size_t dropped = drain_queue();
    if (dropped > 0) {
        PLOG("session", "dropped " << dropped << " stale notification(s)");
    }

    GVariant* value = g_variant_new_fixed_array(
        G_VARIANT_TYPE_BYTE,
        data.data(),
        data.size(),
        sizeof(guint8)
    );

    GVariantBuilder opts;
    g_variant_builder_init(&opts, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&opts, "{sv}", "type",
                          g_variant_new_string(no_ack ? "command" : "request"));

    GVariant* children[2] = { value, g_variant_builder_end(&opts) };
    GVariant* params = g_variant_new_tuple(children, 2);

    m_bus->call(ch.path, "org.bluez.GattCharacteristic1", "WriteValue",
                params, nullptr, kWriteTimeoutMs, PenErrorKind::ProtocolError);

    PLOG("session", "wrote " << data.size() << " bytes to " << char_uuid
         << (no_ack ? " (no ack)" : " (with ack)"));
}

std::vector<uint8_t> BleTransport::receive(const std::string& service_uuid,
                                           const std::string& char_uuid,
                                           int timeout_ms) {
    bool expected = false;
    if (!m_receiving.compare_exchange_strong(expected, true)) {
        throw PenError(PenErrorKind::ProtocolError, "receive already in progress");
    }
    ReceiveGuard guard{m_receiving};

    require_connected("receive");

    CharInfo ch = find_characteristic(service_uuid, char_uuid);

    if (!ch.has_flag("notify") && !ch.has_flag("indicate")) {
        // No push channel on this characteristic, poll it
        GVariantBuilder opts;
        g_variant_builder_init(&opts, G_VARIANT_TYPE("a{sv}"));
        VariantPtr result = m_bus->call(ch.path, "org.bluez.GattCharacteristic1",
                                        "ReadValue",
                                        g_variant_new("(a{sv})", &opts),
                                        G_VARIANT_TYPE("(ay)"),
                                        timeout_ms, PenErrorKind::ProtocolError);
        GVariant* bytes = g_variant_get_child_value(result.get(), 0);
        gsize len = 0;
        const guint8* raw = static_cast<const guint8*>(
            g_variant_get_fixed_array(bytes, &len, sizeof(guint8)));
        std::vector<uint8_t> out(raw, raw + len);
        g_variant_unref(bytes);
        return out;
    }

    ensure_listener(ch);

    std::unique_lock<std::mutex> lock(m_notif_mutex);
    if (!m_notif_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this]{ return !m_notif_queue.empty(); })) {
        lock.unlock();
        if (!is_alive()) {
            throw PenError(PenErrorKind::ConnectionDropped,
                           m_address + " disconnected while waiting for a reply");
        }
        throw PenError(PenErrorKind::ProtocolTimeout,
                       "no reply on " + char_uuid + " within " +
                       std::to_string(timeout_ms) + "ms");
    }
    auto data = std::move(m_notif_queue.front());
    m_notif_queue.pop_front();
    return data;
}

void BleTransport::ensure_listener(const CharInfo& ch) {
    if (!ch.has_flag("notify") && !ch.has_flag("indicate")) {
        return;
    }
    if (m_signal_sub_id == 0 || m_listen_char_path != ch.path) {
        stop_listener();
        arm_listener(ch);
    }
}

void BleTransport::arm_listener(const CharInfo& ch) {
    // Subscribe before StartNotify so the first value is not missed
    m_signal_sub_id = g_dbus_connection_signal_subscribe(
        m_bus->connection(),
        "org.bluez",
        "org.freedesktop.DBus.Properties",
        "PropertiesChanged",
        ch.path.c_str(),
        nullptr,
        G_DBUS_SIGNAL_FLAGS_NONE,
        &BleTransport::properties_changed_cb,
        this,
        nullptr
    );
    if (m_signal_sub_id == 0) {
        throw PenError(PenErrorKind::ProtocolError,
                       "failed to subscribe to PropertiesChanged on " + ch.path);
    }

    try {
        m_bus->call(ch.path, "org.bluez.GattCharacteristic1", "StartNotify",
                    nullptr, nullptr, 5000, PenErrorKind::ProtocolError);
    } catch (const PenError&) {
        g_dbus_connection_signal_unsubscribe(m_bus->connection(), m_signal_sub_id);
        m_signal_sub_id = 0;
        throw;
    }

    m_listen_char_path = ch.path;
    PLOG("session", "listener armed on " << ch.path);
}

void BleTransport::stop_listener() {
    if (m_signal_sub_id == 0 && m_listen_char_path.empty()) {
        return;
    }

    if (!m_listen_char_path.empty()) {
        try {
            m_bus->call(m_listen_char_path, "org.bluez.GattCharacteristic1",
                        "StopNotify", nullptr, nullptr, 2000,
                        PenErrorKind::ProtocolError);
        } catch (const PenError& e) {
            // Not fatal, the link may already be gone
            PLOG("session", "StopNotify: " << e.what());
        }
    }

    if (m_signal_sub_id != 0 && m_bus->connection()) {
        g_dbus_connection_signal_unsubscribe(m_bus->connection(), m_signal_sub_id);
    }
    m_signal_sub_id = 0;
    m_listen_char_path.clear();
    drain_queue();
}

void BleTransport::disconnect() {
    stop_listener();

    if (!m_device_path.empty()) {
        try {
            m_bus->call(m_device_path, "org.bluez.Device1", "Disconnect",
                        nullptr, nullptr, 5000, PenErrorKind::ConnectionDropped);
            PLOG("session", "disconnected " << m_address);
        } catch (const PenError& e) {
            // Might already be disconnected
            PLOG("session", "Device.Disconnect: " << e.what());
        }
    }

    m_device_path.clear();
    m_address.clear();
}

size_t BleTransport::drain_queue() {
    std::lock_guard<std::mutex> lock(m_notif_mutex);
    size_t n = m_notif_queue.size();
    m_notif_queue.clear();
    return n;
}

void BleTransport::handle_notification(const uint8_t* value, size_t value_length) {
    std::lock_guard<std::mutex> lock(m_notif_mutex);
    if (m_notif_queue.size() >= kQueueCapacity) {
        m_notif_queue.pop_front();
    }
    m_notif_queue.emplace_back(value, value + value_length);
    m_notif_cv.notify_all();
}

void BleTransport::properties_changed_cb(GDBusConnection*,
                                         const gchar*,
                                         const gchar*,
                                         const gchar*,
                                         const gchar*,
                                         GVariant* parameters,
                                         gpointer user_data) {
    auto* self = static_cast<BleTransport*>(user_data);
    if (!self) return;

    const gchar* iface = nullptr;
    GVariant* changed = nullptr;
    GVariant* invalidated = nullptr;

    g_variant_get(parameters, "(&s@a{sv}@as)", &iface, &changed, &invalidated);
    if (std::string(iface) != "org.bluez.GattCharacteristic1") {
        g_variant_unref(changed);
        g_variant_unref(invalidated);
        return;
    }

    GVariant* val = g_variant_lookup_value(changed, "Value", G_VARIANT_TYPE("ay"));
    if (val) {
        gsize len = 0;
        const guint8* data = static_cast<const guint8*>(
            g_variant_get_fixed_array(val, &len, sizeof(guint8)));
        if (data && len > 0) {
            self->handle_notification(data, len);
        }
        g_variant_unref(val);
    }

    g_variant_unref(changed);
    g_variant_unref(invalidated);
}
