#pragma once
#include "bluez_bus.h"
#include "pen_error.h"
#include <memory>
#include <string>

enum class RadioState {
    Ok,
    Unavailable,
    Denied
};

const char* to_string(RadioState state);

// Denied when BlueZ or the bus policy refused the call, Unavailable otherwise
RadioState radio_state_for(const PenError& e);

// Can the host radio be used right now? Consulted before every connection
// attempt; the device manager only sees this interface.
class RadioCapability {
public:
    virtual ~RadioCapability() = default;
    virtual RadioState enable() = 0;
    virtual const char* name() const = 0;
};

// Powers the adapter through org.bluez.Adapter1.Powered
class BluezAdapterPower : public RadioCapability {
public:
    explicit BluezAdapterPower(std::shared_ptr<BluezBus> bus);
    RadioState enable() override;
    const char* name() const override { return "adapter-power"; }

private:
    std::shared_ptr<BluezBus> m_bus;
};

// Lighter check: is BlueZ on the bus and does it expose our adapter?
class BluezStackProbe : public RadioCapability {
public:
    explicit BluezStackProbe(std::shared_ptr<BluezBus> bus);
    RadioState enable() override;
    const char* name() const override { return "stack-probe"; }

private:
    std::shared_ptr<BluezBus> m_bus;
};
