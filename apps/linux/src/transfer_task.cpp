#include "transfer_task.h"
#include "auth_info.h"
#include "debug_utils.h"

TransferTask::TransferTask(std::shared_ptr<StorageClient> client, TransferOptions opts)
    : m_client(std::move(client)), m_opts(std::move(opts)) {
    if (!m_opts.sleep) {
        m_opts.sleep = real_sleep;
    }
}

TransferState TransferTask::run() {
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_state == TransferState::Active || m_state == TransferState::Completed) {
            return m_state;
        }
        if (m_state == TransferState::Paused || m_state == TransferState::Error) {
            m_pause.store(false);
        }
        m_state = TransferState::Active;
        m_error.clear();
        m_failed_chunk = TransferError::kNoChunk;
    }

    try {
        execute();
    } catch (const TransferError& e) {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = TransferState::Error;
        m_error = std::string(to_string(e.kind())) + ": " + e.what();
        m_failed_chunk = e.chunk_index();
        PLOG("transfer", "failed: " << m_error);
        return m_state;
    } catch (const std::exception& e) {
        // Worker threads must not see anything escape run()
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = TransferState::Error;
        m_error = e.what();
        PLOG("transfer", "failed: " << m_error);
        return m_state;
    }

    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_state == TransferState::Active) {
        m_state = TransferState::Completed;
    }
    return m_state;
}

void TransferTask::pause() {
    m_pause.store(true);
}

bool TransferTask::requeue() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_state != TransferState::Paused && m_state != TransferState::Error) {
        return false;
    }
    m_state = TransferState::Pending;
    m_pause.store(false);
    return true;
}

void TransferTask::mark_paused() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_state = TransferState::Paused;
    PLOG("transfer", "paused at " << m_transferred.load() << " bytes");
}

TransferState TransferTask::state() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

int64_t TransferTask::failed_chunk() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_failed_chunk;
}

TransferProgress TransferTask::progress() const {
    TransferProgress p;
    fill_progress(p);
    p.transferred = m_transferred.load();
    std::lock_guard<std::mutex> lock(m_state_mutex);
    p.state = m_state;
    p.error = m_error;
    return p;
}
