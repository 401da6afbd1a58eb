#include "upload_task.h"
#include "debug_utils.h"
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

UploadTask::UploadTask(std::shared_ptr<StorageClient> client,
                       std::string local_path,
                       std::optional<std::string> target_path,
                       TransferOptions opts)
    : TransferTask(std::move(client), std::move(opts)),
      m_local_path(std::move(local_path)),
      m_target_path(std::move(target_path)) {}

std::string UploadTask::init() {
    std::error_code ec;
    if (!fs::is_regular_file(m_local_path, ec)) {
        throw TransferError(TransferErrorKind::FileNotFound,
                            "local file not found: " + m_local_path);
    }
    uint64_t size = fs::file_size(m_local_path, ec);
    if (ec) {
        throw TransferError(TransferErrorKind::LocalIo,
                            "cannot stat " + m_local_path + ": " + ec.message());
    }
    std::string filename = fs::path(m_local_path).filename().string();

    std::string id = with_retry(TransferError::kNoChunk, "upload init",
                                [&]() { return m_client->init_upload(filename, size); });

    std::lock_guard<std::mutex> lock(m_info_mutex);
    m_upload_id = id;
    m_filename = filename;
    m_size = size;
    return id;
}

std::string UploadTask::upload_id() const {
    std::lock_guard<std::mutex> lock(m_info_mutex);
    return m_upload_id;
}

std::string UploadTask::read_chunk(std::ifstream& in, const ChunkRange& r) const {
    std::string data(r.length, '\0');
    if (r.length == 0) {
        return data;
    }
    in.clear();
    in.seekg((std::streamoff)r.offset);
    in.read(&data[0], (std::streamsize)r.length);
    if ((uint64_t)in.gcount() != r.length) {
        throw TransferError(TransferErrorKind::LocalIo,
                            "short read of chunk " + std::to_string(r.index) +
                            " from " + m_local_path, 0, (int64_t)r.index);
    }
    return data;
}

void UploadTask::execute() {
    if (upload_id().empty()) {
        init();
    }

    const std::string id = upload_id();
    const uint64_t total = m_size;
    const uint64_t chunks = chunk_count(total, m_opts.chunk_size);

    std::set<uint64_t> accepted;
    try {
        accepted = m_client->upload_status(id);
    } catch (const TransferError& e) {
        PLOG("upload", "status of " << id << " unavailable (" << e.what()
             << "), sending every chunk");
    }

    uint64_t already = 0;
    for (uint64_t idx : accepted) {
        if (idx < chunks) {
            already += chunk_range(idx, total, m_opts.chunk_size).length;
        }
    }
    set_transferred(already);
    if (!accepted.empty()) {
        PLOG("upload", id << ": server holds " << accepted.size() << "/" << chunks << " chunk(s)");
    }

    std::ifstream in(m_local_path, std::ios::binary);
    if (!in) {
        throw TransferError(TransferErrorKind::LocalIo, "cannot open " + m_local_path);
    }

    for (uint64_t i = 0; i < chunks; ++i) {
        if (accepted.count(i)) {
            continue;
        }
        if (pause_requested()) {
            mark_paused();
            return;
        }

        ChunkRange r = chunk_range(i, total, m_opts.chunk_size);
        std::string data = read_chunk(in, r);
        with_retry((int64_t)i, ("chunk " + std::to_string(i)).c_str(), [&]() {
            m_client->upload_chunk(id, i, data);
        });
        add_transferred(r.length);
    }

    with_retry(TransferError::kNoChunk, "upload finish", [&]() {
        m_client->finish_upload(id, m_filename, chunks, m_target_path);
    });
    PLOG("upload", "done " << m_filename << " as " << id);
}

void UploadTask::fill_progress(TransferProgress& p) const {
    std::lock_guard<std::mutex> lock(m_info_mutex);
    p.id = m_upload_id;
    p.name = m_filename;
    p.total_size = m_size;
    p.total_chunks = m_upload_id.empty() ? 0 : chunk_count(m_size, m_opts.chunk_size);
    p.local_path = m_local_path;
}
