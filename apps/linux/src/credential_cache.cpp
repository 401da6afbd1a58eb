#include "credential_cache.h"

CredentialCache::CredentialCache(SteadyClockFn clock)
    : m_clock(std::move(clock)) {}

std::optional<std::string> CredentialCache::fresh_totp() const {
    if (!m_totp) {
        return std::nullopt;
    }
    auto age = m_clock() - m_totp_at;
    if (age < kTotpWindow - kTotpRefreshLead) {
        return m_totp;
    }
    return std::nullopt;
}

void CredentialCache::store_totp(const std::string& code) {
    m_totp = code;
    m_totp_at = m_clock();
}

std::optional<std::string> CredentialCache::device_id() const {
    return m_device_id;
}

void CredentialCache::store_device_id(const std::string& id) {
    m_device_id = id;
}

void CredentialCache::clear() {
    m_totp.reset();
    m_totp_at = {};
    m_device_id.reset();
}

bool CredentialCache::empty() const {
    return !m_totp && !m_device_id;
}
