#pragma once
#include <cstdint>
#include <string>
#include <vector>

// A peer seen during a scan
struct BleDeviceInfo {
    std::string address;
    std::string name;
    std::vector<std::string> uuids;   // advertised service UUIDs, lower case
    std::string object_path;          // BlueZ object path, empty for fakes
};

// Discovery side of the radio. Failures are raised as PenError.
class LinkAdapter {
public:
    virtual ~LinkAdapter() = default;

    virtual std::vector<BleDeviceInfo> scan(int duration_ms) = 0;

    // Re-scans and picks the peer with this address
    virtual BleDeviceInfo resolve(const std::string& address, int duration_ms) = 0;
};

// One connection to one peer, plus its response listener.
class LinkSession {
public:
    virtual ~LinkSession() = default;

    // Failures of any sort are raised as ConnectFailed and leave no link
    virtual void connect(const BleDeviceInfo& peer) = 0;

    // Arms the response listener on this characteristic. Called right after
    // connect(), so the listener runs for as long as the link does.
    virtual void listen(const std::string& service_uuid,
                        const std::string& char_uuid) = 0;

    // Queries the live transport every time
    virtual bool is_alive() = 0;

    virtual void send(const std::string& service_uuid,
                      const std::string& char_uuid,
                      const std::vector<uint8_t>& data) = 0;

    virtual std::vector<uint8_t> receive(const std::string& service_uuid,
                                         const std::string& char_uuid,
                                         int timeout_ms) = 0;

    // Best effort, never throws
    virtual void disconnect() = 0;
};
