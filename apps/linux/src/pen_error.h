#pragma once
#include <stdexcept>
#include <string>

// Failure kinds surfaced by the wireless layers. Only the device manager
// decides which of them are worth a reconnect.
enum class PenErrorKind {
    RadioUnavailable,
    DiscoveryFailed,
    NoMatchingDevice,
    ConnectFailed,
    ConnectionDropped,
    ProtocolTimeout,
    ProtocolError,
    EncodingError
};

inline const char* to_string(PenErrorKind kind) {
    switch (kind) {
    case PenErrorKind::RadioUnavailable:  return "RadioUnavailable";
    case PenErrorKind::DiscoveryFailed:   return "DiscoveryFailed";
    case PenErrorKind::NoMatchingDevice:  return "NoMatchingDevice";
    case PenErrorKind::ConnectFailed:     return "ConnectFailed";
    case PenErrorKind::ConnectionDropped: return "ConnectionDropped";
    case PenErrorKind::ProtocolTimeout:   return "ProtocolTimeout";
    case PenErrorKind::ProtocolError:     return "ProtocolError";
    case PenErrorKind::EncodingError:     return "EncodingError";
    }
    return "Unknown";
}

class PenError : public std::runtime_error {
public:
    PenError(PenErrorKind kind, const std::string& msg,
             const std::string& dbus_error = std::string())
        : std::runtime_error(msg), m_kind(kind), m_dbus_error(dbus_error) {}

    PenErrorKind kind() const { return m_kind; }

    // D-Bus error name when BlueZ rejected the call, e.g.
    // "org.bluez.Error.NotPermitted"; empty otherwise
    const std::string& dbus_error() const { return m_dbus_error; }

    // A dropped or never-established link; the manager reconnects on these.
    bool is_link_failure() const {
        return m_kind == PenErrorKind::ConnectionDropped ||
               m_kind == PenErrorKind::ConnectFailed;
    }

private:
    PenErrorKind m_kind;
    std::string m_dbus_error;
};
