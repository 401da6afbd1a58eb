#include "transfer_types.h"
#include <stdexcept>

uint64_t chunk_count(uint64_t total_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (total_size == 0) {
        return 1;
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

ChunkRange chunk_range(uint64_t index, uint64_t total_size, uint64_t chunk_size) {
    ChunkRange r;
    r.index = index;
    r.offset = index * chunk_size;
    if (r.offset >= total_size) {
        r.length = 0;
    } else {
        uint64_t remaining = total_size - r.offset;
        r.length = remaining < chunk_size ? remaining : chunk_size;
    }
    return r;
}

std::vector<ChunkRange> plan_chunks(uint64_t total_size, uint64_t chunk_size) {
    std::vector<ChunkRange> out;
    uint64_t n = chunk_count(total_size, chunk_size);
    out.reserve(n);
    for (uint64_t i = 0; i < n; ++i) {
        out.push_back(chunk_range(i, total_size, chunk_size));
    }
    return out;
}

const char* to_string(TransferState state) {
    switch (state) {
    case TransferState::Pending:   return "pending";
    case TransferState::Active:    return "active";
    case TransferState::Paused:    return "paused";
    case TransferState::Completed: return "completed";
    case TransferState::Error:     return "error";
    }
    return "unknown";
}
