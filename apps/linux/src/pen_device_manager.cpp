#include "pen_device_manager.h"
#include "debug_utils.h"
#include <glib.h>
#include <cctype>

const char* to_string(ConnectionPhase phase) {
    switch (phase) {
    case ConnectionPhase::Disconnected: return "disconnected";
    case ConnectionPhase::Connecting:   return "connecting";
    case ConnectionPhase::Connected:    return "connected";
    }
    return "unknown";
}

static bool has_prefix_nocase(const std::string& name, const std::string& prefix) {
    if (name.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower((unsigned char)name[i]) != std::tolower((unsigned char)prefix[i])) {
            return false;
        }
    }
    return true;
}

static bool same_address(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

PenDeviceManager::PenDeviceManager(std::shared_ptr<LinkAdapter> adapter,
                                   std::unique_ptr<LinkSession> session,
                                   std::unique_ptr<RadioCapability> radio,
                                   std::unique_ptr<RadioCapability> radio_probe,
                                   DeviceManagerOptions opts,
                                   SteadyClockFn clock,
                                   SleepFn sleep)
    : m_adapter(std::move(adapter)),
      m_session(std::move(session)),
      m_radio(std::move(radio)),
      m_radio_probe(std::move(radio_probe)),
      m_opts(std::move(opts)),
      m_sleep(std::move(sleep)),
      m_cache(std::move(clock)) {}

PenDeviceManager::~PenDeviceManager() {
    cleanup();
}

void PenDeviceManager::ensure_connected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_connected_locked();
}

void PenDeviceManager::ensure_radio_locked() {
    RadioState state = m_radio ? m_radio->enable() : RadioState::Unavailable;
    if (state == RadioState::Ok) {
        return;
    }
    PLOG("manager", (m_radio ? m_radio->name() : "radio") << ": "
         << to_string(state) << ", trying fallback");

    RadioState fallback = m_radio_probe ? m_radio_probe->enable() : RadioState::Unavailable;
    if (fallback == RadioState::Ok) {
        return;
    }
    throw PenError(PenErrorKind::RadioUnavailable,
                   std::string("bluetooth radio not usable (") + to_string(state) +
                   ", fallback " + to_string(fallback) + ")");
}

std::vector<BleDeviceInfo> PenDeviceManager::matching_peers_locked() {
    std::vector<BleDeviceInfo> peers = m_adapter->scan(m_opts.scan_ms);
    std::vector<BleDeviceInfo> out;
    for (auto& p : peers) {
        if (has_prefix_nocase(p.name, m_opts.name_prefix)) {
            out.push_back(std::move(p));
        }
    }
    PLOG("manager", "scan: " << peers.size() << " peer(s), "
         << out.size() << " matching '" << m_opts.name_prefix << "'");
    return out;
}

void PenDeviceManager::ensure_connected_locked() {
    ensure_radio_locked();

    if (m_connected_address) {
        if (m_session->is_alive()) {
            m_phase = ConnectionPhase::Connected;
            return;
        }
        PLOG("manager", "link to " << *m_connected_address << " is gone");
        drop_link_locked();
    }

    m_phase = ConnectionPhase::Connecting;
    try {
        std::vector<BleDeviceInfo> candidates = matching_peers_locked();
        if (candidates.empty()) {
            throw PenError(PenErrorKind::NoMatchingDevice,
                           "no device named '" + m_opts.name_prefix + "*' in range");
        }
        for (size_t i = 1; i < candidates.size(); ++i) {
            PLOG("manager", "also seen: " << candidates[i].name
                 << " (" << candidates[i].address << ")");
        }

        const BleDeviceInfo& chosen = candidates.front();
        PLOG("manager", "connecting to " << chosen.name << " (" << chosen.address << ")");
        m_session->connect(chosen);
        try {
            m_session->listen(kPenServiceUuid, kPenCharUuid);
        } catch (const PenError& e) {
            m_session->disconnect();
            throw PenError(PenErrorKind::ConnectFailed,
                           "no command channel on " + chosen.address + ": " + e.what());
        }

        if (m_peer && !same_address(m_peer->address, chosen.address)) {
            // Credentials belong to the previous pen
            m_cache.clear();
        }
        m_connected_address = chosen.address;
        m_peer = chosen;
        m_phase = ConnectionPhase::Connected;
        ++m_link_epoch;
    } catch (const PenError&) {
        m_phase = ConnectionPhase::Disconnected;
        throw;
    }

    m_sleep(m_opts.settle);
}

void PenDeviceManager::drop_link_locked() {
    m_connected_address.reset();
    m_session->disconnect();
    m_phase = ConnectionPhase::Disconnected;
}

template <typename Fn>
auto PenDeviceManager::with_reconnect_locked(const char* what, int max_retries, Fn fn)
    -> decltype(fn()) {
    int retries = 0;
    while (true) {
        try {
            ensure_connected_locked();
            return fn();
        } catch (const PenError& e) {
            if (!e.is_link_failure() || retries >= max_retries) {
                throw;
            }
            ++retries;
            PLOG("manager", what << ": " << to_string(e.kind()) << " (" << e.what()
                 << "), reconnect " << retries << "/" << max_retries);
            m_sleep(m_opts.retry_delay);
            drop_link_locked();
        }
    }
}

std::vector<uint8_t> PenDeviceManager::send_receive_locked(const std::string& command,
                                                           int max_retries) {
    return with_reconnect_locked(command.c_str(), max_retries, [&]() {
        return exchange_locked(command);
    });
}

std::vector<uint8_t> PenDeviceManager::exchange_locked(const std::string& command) {
    m_session->send(kPenServiceUuid, kPenCharUuid,
                    std::vector<uint8_t>(command.begin(), command.end()));
    return m_session->receive(kPenServiceUuid, kPenCharUuid, m_opts.receive_timeout_ms);
}

std::vector<uint8_t> PenDeviceManager::send_receive_with_retry(const std::string& command,
                                                               int max_retries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return send_receive_locked(command, max_retries);
}

void PenDeviceManager::sync_time_locked() {
    long long epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string command = "setTime:" + std::to_string(epoch);
    m_session->send(kPenServiceUuid, kPenCharUuid,
                    std::vector<uint8_t>(command.begin(), command.end()));

    m_sleep(m_opts.set_time_pause);

    // Some firmware echoes setTime, some stays silent
    try {
        std::vector<uint8_t> echo = m_session->receive(kPenServiceUuid, kPenCharUuid,
                                                       m_opts.set_time_echo_ms);
        PLOG("manager", "setTime echo: " << std::string(echo.begin(), echo.end()));
    } catch (const PenError& e) {
        PLOG("manager", "no setTime echo (" << to_string(e.kind()) << ")");
    }
}

std::string PenDeviceManager::decode_reply(const std::vector<uint8_t>& raw,
                                           const char* what) const {
    std::string s(raw.begin(), raw.end());
    if (!g_utf8_validate(s.data(), (gssize)s.size(), nullptr)) {
        throw PenError(PenErrorKind::EncodingError,
                       std::string(what) + " reply is not valid UTF-8");
    }
    while (!s.empty() && (s.back() == '\0' || std::isspace((unsigned char)s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string PenDeviceManager::get_totp() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto cached = m_cache.fresh_totp()) {
        PLOG("manager", "TOTP from cache");
        return *cached;
    }

    // Every link that answers getTotp gets the clock first
    uint64_t synced_link = 0;
    std::vector<uint8_t> raw = with_reconnect_locked("getTotp", m_opts.max_retries, [&]() {
        if (synced_link != m_link_epoch) {
            sync_time_locked();
            synced_link = m_link_epoch;
        }
        return exchange_locked("getTotp");
    });

    std::string code = decode_reply(raw, "getTotp");
    m_cache.store_totp(code);
    PLOG("manager", "TOTP " << mask_secret(code));
    return code;
}

std::string PenDeviceManager::get_device_id() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto cached = m_cache.device_id()) {
        return *cached;
    }

    std::string id = decode_reply(send_receive_locked("getId", m_opts.max_retries),
                                  "getId");
    m_cache.store_device_id(id);
    PLOG("manager", "device id " << id);
    return id;
}

void PenDeviceManager::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    if (m_connected_address) {
        PLOG("manager", "disconnecting " << *m_connected_address);
    }
    drop_link_locked();
    m_peer.reset();
}

void PenDeviceManager::cleanup() {
    disconnect();
}

void PenDeviceManager::revalidate_locked() {
    if (m_phase == ConnectionPhase::Connected && !m_session->is_alive()) {
        PLOG("manager", "link to " << (m_peer ? m_peer->address : "?") << " is gone");
        drop_link_locked();
    }
}

std::string PenDeviceManager::connection_status() {
    std::lock_guard<std::mutex> lock(m_mutex);
    revalidate_locked();
    std::string s = to_string(m_phase);
    if (m_phase == ConnectionPhase::Connected && m_peer) {
        s += ": " + m_peer->name + " (" + m_peer->address + ")";
    }
    return s;
}

bool PenDeviceManager::is_connected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    revalidate_locked();
    return m_phase == ConnectionPhase::Connected;
}

ConnectionPhase PenDeviceManager::phase() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_phase;
}

std::optional<BleDeviceInfo> PenDeviceManager::current_device() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_phase != ConnectionPhase::Connected) {
        return std::nullopt;
    }
    return m_peer;
}

std::vector<BleDeviceInfo> PenDeviceManager::scan_peers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_radio_locked();
    return matching_peers_locked();
}
