#pragma once
#include "auth_info.h"
#include "clock_utils.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

static constexpr uint64_t kChunkSize = 4ull * 1024 * 1024;

// Byte span [offset, offset + length) of one chunk
struct ChunkRange {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;

    // Inclusive end as used in "Range: bytes=a-b"
    uint64_t last_byte() const { return offset + length - 1; }
};

// ceil(total / chunk), but at least one chunk so an empty file still uploads
uint64_t chunk_count(uint64_t total_size, uint64_t chunk_size = kChunkSize);

ChunkRange chunk_range(uint64_t index, uint64_t total_size,
                       uint64_t chunk_size = kChunkSize);

std::vector<ChunkRange> plan_chunks(uint64_t total_size,
                                    uint64_t chunk_size = kChunkSize);

enum class TransferState {
    Pending,
    Active,
    Paused,
    Completed,
    Error
};

const char* to_string(TransferState state);

struct TransferProgress {
    std::string id;
    std::string name;
    uint64_t total_size = 0;
    uint64_t transferred = 0;
    uint64_t total_chunks = 0;
    TransferState state = TransferState::Pending;
    std::string error;          // set in Error state
    std::string sha256;         // downloads, once completed
    std::string local_path;

    double percent() const {
        if (total_size == 0) {
            return state == TransferState::Completed ? 100.0 : 0.0;
        }
        return 100.0 * (double)transferred / (double)total_size;
    }
};

struct TransferOptions {
    uint64_t chunk_size = kChunkSize;
    int max_attempts = 3;
    std::chrono::milliseconds retry_backoff{1000};
    SleepFn sleep = real_sleep;

    // Asked for fresh credentials when the server rejects the current ones
    std::function<AuthInfo()> refresh_auth;
};
