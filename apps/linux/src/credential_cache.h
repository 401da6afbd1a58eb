#pragma once
#include "clock_utils.h"
#include <chrono>
#include <optional>
#include <string>

// TOTP plus device id, as last read from the pen.
//
// The code rotates every 30s; we stop serving it 5s before the window ends
// so a code handed to the HTTP layer is still valid when the server checks it.
// The device id never changes for a given pen and is kept until clear().
class CredentialCache {
public:
    static constexpr std::chrono::seconds kTotpWindow{30};
    static constexpr std::chrono::seconds kTotpRefreshLead{5};

    explicit CredentialCache(SteadyClockFn clock = steady_now);

    // Cached code while its age is below window - lead
    std::optional<std::string> fresh_totp() const;
    void store_totp(const std::string& code);

    std::optional<std::string> device_id() const;
    void store_device_id(const std::string& id);

    void clear();
    bool empty() const;

private:
    SteadyClockFn m_clock;

    std::optional<std::string> m_totp;
    std::chrono::steady_clock::time_point m_totp_at{};

    std::optional<std::string> m_device_id;
};
