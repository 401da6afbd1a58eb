#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

enum class TransferErrorKind {
    FileNotFound,
    HttpStatus,
    Network,
    ChunkFailed,
    IntegrityMismatch,
    LocalIo,
    BadResponse
};

inline const char* to_string(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::FileNotFound:      return "FileNotFound";
    case TransferErrorKind::HttpStatus:        return "HttpStatus";
    case TransferErrorKind::Network:           return "Network";
    case TransferErrorKind::ChunkFailed:       return "ChunkFailed";
    case TransferErrorKind::IntegrityMismatch: return "IntegrityMismatch";
    case TransferErrorKind::LocalIo:           return "LocalIo";
    case TransferErrorKind::BadResponse:       return "BadResponse";
    }
    return "Unknown";
}

class TransferError : public std::runtime_error {
public:
    static constexpr int64_t kNoChunk = -1;

    TransferError(TransferErrorKind kind,
                  const std::string& msg,
                  int http_status = 0,
                  int64_t chunk_index = kNoChunk)
        : std::runtime_error(msg),
          m_kind(kind),
          m_http_status(http_status),
          m_chunk_index(chunk_index) {}

    TransferErrorKind kind() const { return m_kind; }
    int http_status() const { return m_http_status; }
    int64_t chunk_index() const { return m_chunk_index; }

    bool is_auth_rejected() const {
        return m_kind == TransferErrorKind::HttpStatus &&
               (m_http_status == 401 || m_http_status == 403);
    }

private:
    TransferErrorKind m_kind;
    int m_http_status;
    int64_t m_chunk_index;
};
