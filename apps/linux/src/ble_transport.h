#pragma once
#include "ble_link.h"
#include "bluez_bus.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// GATT session with one peer over BlueZ.
//
// States: Idle -> Connected (listener armed) -> Idle.
// The listener is a PropertiesChanged subscription on one characteristic plus
// StartNotify; notifications are delivered on the bus main loop thread into a
// bounded queue and popped by receive(). listen() arms it right after connect,
// send() re-arms it before writing when another characteristic is targeted,
// and disconnect always tears it down.
class BleTransport : public LinkSession {
public:
    static constexpr size_t kQueueCapacity = 10;
    static constexpr int kConnectTimeoutMs = 15000;
    static constexpr int kSettleMs = 100;
    static constexpr int kServicesResolvedMs = 3000;
    static constexpr int kWriteTimeoutMs = 2000;

    explicit BleTransport(std::shared_ptr<BluezBus> bus);
    ~BleTransport() override;

    void connect(const BleDeviceInfo& peer) override;
    bool is_alive() override;
    void send(const std::string& service_uuid,
              const std::string& char_uuid,
              const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> receive(const std::string& service_uuid,
                                 const std::string& char_uuid,
                                 int timeout_ms) override;
    void listen(const std::string& service_uuid,
                const std::string& char_uuid) override;
    void disconnect() override;

private:
    struct CharInfo {
        std::string path;
        std::vector<std::string> flags;

        bool has_flag(const char* f) const;
    };

    void require_connected(const char* op) const;
    void wait_services_resolved();
    CharInfo find_characteristic(const std::string& service_uuid,
                                 const std::string& char_uuid);
    void abort_connect(const BleDeviceInfo& peer);
    void ensure_listener(const CharInfo& ch);
    void arm_listener(const CharInfo& ch);
    void stop_listener();
    size_t drain_queue();

    // Called from the GLib thread
    void handle_notification(const uint8_t* value, size_t value_length);

    static void properties_changed_cb(GDBusConnection* connection,
                                      const gchar* sender_name,
                                      const gchar* object_path,
                                      const gchar* interface_name,
                                      const gchar* signal_name,
                                      GVariant* parameters,
                                      gpointer user_data);

    std::shared_ptr<BluezBus> m_bus;

    std::string m_device_path;
    std::string m_address;

    std::string m_listen_char_path;
    guint m_signal_sub_id = 0;

    std::atomic<bool> m_receiving{false};

    mutable std::mutex m_notif_mutex;
    std::condition_variable m_notif_cv;
    std::deque<std::vector<uint8_t>> m_notif_queue;
};
