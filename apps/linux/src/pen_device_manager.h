#pragma once
#include "ble_link.h"
#include "clock_utils.h"
#include "credential_cache.h"
#include "pen_error.h"
#include "radio_capability.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// GATT addressing of the Cpen command channel
static constexpr const char* kPenServiceUuid = "d816e4c6-1b99-4da7-bcd5-7c37cc2642c4";
static constexpr const char* kPenCharUuid    = "d816e4c7-1b99-4da7-bcd5-7c37cc2642c4";

struct DeviceManagerOptions {
    std::string name_prefix = "cpen";     // matched case-insensitively
    int scan_ms = 5000;
    int max_retries = 2;                  // reconnects per command
    std::chrono::milliseconds settle{500};
    std::chrono::milliseconds retry_delay{500};
    int receive_timeout_ms = 10000;
    std::chrono::milliseconds set_time_pause{100};
    int set_time_echo_ms = 500;
};

enum class ConnectionPhase {
    Disconnected,
    Connecting,
    Connected
};

const char* to_string(ConnectionPhase phase);

// Owns the one link to the pen and the credentials read over it.
//
// Invariant: at most one connected peer. m_connected_address is set only
// after a successful connect and cleared before any new connection attempt.
// Every public method serialises on one mutex, so a command and its reply
// are never interleaved with another caller's.
class PenDeviceManager {
public:
    PenDeviceManager(std::shared_ptr<LinkAdapter> adapter,
                     std::unique_ptr<LinkSession> session,
                     std::unique_ptr<RadioCapability> radio,
                     std::unique_ptr<RadioCapability> radio_probe,
                     DeviceManagerOptions opts = DeviceManagerOptions(),
                     SteadyClockFn clock = steady_now,
                     SleepFn sleep = real_sleep);
    ~PenDeviceManager();

    PenDeviceManager(const PenDeviceManager&) = delete;
    PenDeviceManager& operator=(const PenDeviceManager&) = delete;

    void ensure_connected();

    // Connects if needed, then writes 'command' and waits for its reply.
    // Reconnects up to 'max_retries' times on a failed or dropped link.
    std::vector<uint8_t> send_receive_with_retry(const std::string& command,
                                                 int max_retries);

    std::string get_totp();
    std::string get_device_id();

    // Clears the credentials and drops the link. Never throws.
    void disconnect();
    void cleanup();

    std::string connection_status();
    bool is_connected();
    ConnectionPhase phase();
    std::optional<BleDeviceInfo> current_device();

    // Scan only, filtered by the name prefix; does not touch the session
    std::vector<BleDeviceInfo> scan_peers();

private:
    void ensure_connected_locked();
    void ensure_radio_locked();
    std::vector<BleDeviceInfo> matching_peers_locked();
    void drop_link_locked();
    void revalidate_locked();

    template <typename Fn>
    auto with_reconnect_locked(const char* what, int max_retries, Fn fn)
        -> decltype(fn());

    std::vector<uint8_t> exchange_locked(const std::string& command);
    std::vector<uint8_t> send_receive_locked(const std::string& command,
                                             int max_retries);
    void sync_time_locked();

    std::string decode_reply(const std::vector<uint8_t>& raw,
                             const char* what) const;

    std::shared_ptr<LinkAdapter> m_adapter;
    std::unique_ptr<LinkSession> m_session;
    std::unique_ptr<RadioCapability> m_radio;
    std::unique_ptr<RadioCapability> m_radio_probe;
    DeviceManagerOptions m_opts;
    SleepFn m_sleep;

    std::mutex m_mutex;
    ConnectionPhase m_phase = ConnectionPhase::Disconnected;
    std::optional<std::string> m_connected_address;
    std::optional<BleDeviceInfo> m_peer;
    uint64_t m_link_epoch = 0;            // bumped on every new link
    CredentialCache m_cache;
};
