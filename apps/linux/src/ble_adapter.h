#pragma once
#include "ble_link.h"
#include "bluez_bus.h"
#include <memory>

// Discovery through org.bluez.Adapter1
class BluezAdapter : public LinkAdapter {
public:
    explicit BluezAdapter(std::shared_ptr<BluezBus> bus);

    std::vector<BleDeviceInfo> scan(int duration_ms) override;
    BleDeviceInfo resolve(const std::string& address, int duration_ms) override;

private:
    std::vector<BleDeviceInfo> list_known_devices();

    std::shared_ptr<BluezBus> m_bus;
};
