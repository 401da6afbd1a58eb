#pragma once
#include "debug_utils.h"
#include "storage_client.h"
#include "transfer_error.h"
#include "transfer_types.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Shared state and control of one download or upload.
//
// run() executes on the registry's worker thread, everything else may be
// called from any thread. Pause is cooperative: the flag is checked before
// every chunk, and a paused task can be run() again to resume.
class TransferTask {
public:
    TransferTask(std::shared_ptr<StorageClient> client, TransferOptions opts);
    virtual ~TransferTask() = default;

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    // Blocks until completed, paused or failed. Typed failures are recorded
    // in the task status and also reflected in the returned state.
    TransferState run();

    void pause();

    // Paused or Error -> Pending, so the task can be run() again.
    // false if it is pending, running or completed.
    bool requeue();

    TransferProgress progress() const;
    TransferState state() const;

    // Index of the chunk that exhausted its attempts, kNoChunk otherwise
    int64_t failed_chunk() const;

protected:
    virtual void execute() = 0;
    virtual void fill_progress(TransferProgress& p) const = 0;

    bool pause_requested() const { return m_pause.load(); }
    void mark_paused();
    void set_transferred(uint64_t bytes) { m_transferred.store(bytes); }
    void add_transferred(uint64_t bytes) { m_transferred.fetch_add(bytes); }

    // Bounded attempts with backoff. Auth rejections refresh the
    // credential first when a refresher is configured. Exhausting the
    // attempts on a chunk raises ChunkFailed tagged with 'chunk_index'.
    template <typename Fn>
    auto with_retry(int64_t chunk_index, const char* what, Fn fn) -> decltype(fn());

    std::shared_ptr<StorageClient> m_client;
    TransferOptions m_opts;

private:
    std::atomic<bool> m_pause{false};
    std::atomic<uint64_t> m_transferred{0};

    mutable std::mutex m_state_mutex;
    TransferState m_state = TransferState::Pending;
    std::string m_error;
    int64_t m_failed_chunk = TransferError::kNoChunk;
};

template <typename Fn>
auto TransferTask::with_retry(int64_t chunk_index, const char* what, Fn fn) -> decltype(fn()) {
    const int attempts = m_opts.max_attempts > 0 ? m_opts.max_attempts : 1;
    for (int attempt = 1; ; ++attempt) {
        try {
            return fn();
        } catch (const TransferError& e) {
            if (e.kind() == TransferErrorKind::FileNotFound ||
                e.kind() == TransferErrorKind::LocalIo) {
                throw;
            }
            PLOG("transfer", what << " attempt " << attempt << "/" << attempts
                 << ": " << e.what());
            if (attempt >= attempts) {
                if (chunk_index == TransferError::kNoChunk) {
                    throw;
                }
                throw TransferError(TransferErrorKind::ChunkFailed,
                                    std::string(what) + " failed after " +
                                    std::to_string(attempts) + " attempts: " + e.what(),
                                    e.http_status(), chunk_index);
            }
            if (e.is_auth_rejected() && m_opts.refresh_auth) {
                try {
                    m_client->set_auth(m_opts.refresh_auth());
                } catch (const std::runtime_error& re) {
                    PLOG("transfer", "credential refresh failed: " << re.what());
                }
            }
            m_opts.sleep(m_opts.retry_backoff);
        }
    }
}
