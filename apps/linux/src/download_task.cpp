#include "download_task.h"
#include "debug_utils.h"
#include "file_hash.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

DownloadTask::DownloadTask(std::shared_ptr<StorageClient> client,
                           std::string remote_path,
                           std::string download_dir,
                           TransferOptions opts)
    : TransferTask(std::move(client), std::move(opts)),
      m_remote_path(std::move(remote_path)),
      m_download_dir(std::move(download_dir)) {}

void DownloadTask::prepare() {
    RemoteFileInfo info = with_retry(TransferError::kNoChunk, "metadata",
                                     [&]() { return m_client->metadata(m_remote_path); });

    std::error_code ec;
    fs::create_directories(m_download_dir, ec);
    if (ec) {
        throw TransferError(TransferErrorKind::LocalIo,
                            "cannot create " + m_download_dir + ": " + ec.message());
    }

    std::lock_guard<std::mutex> lock(m_info_mutex);
    m_info = info;
    m_local_path = (fs::path(m_download_dir) / info.name).string();
    m_prepared = true;
    PLOG("download", m_remote_path << " -> " << m_local_path
         << " (" << info.size << " bytes, " << chunk_count(info.size, m_opts.chunk_size)
         << " chunk(s))");
}

std::string DownloadTask::local_path() const {
    std::lock_guard<std::mutex> lock(m_info_mutex);
    return m_local_path;
}

std::string DownloadTask::sha256() const {
    std::lock_guard<std::mutex> lock(m_info_mutex);
    return m_sha256;
}

uint64_t DownloadTask::resume_offset(uint64_t total_size) const {
    std::error_code ec;
    const std::string path = local_path();
    if (!fs::exists(path, ec)) {
        return 0;
    }
    uint64_t have = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(TransferErrorKind::LocalIo,
                            "cannot stat " + path + ": " + ec.message());
    }
    if (have > total_size) {
        // Not a prefix of this object, start over
        PLOG("download", path << " is larger than the remote file, restarting");
        fs::resize_file(path, 0, ec);
        if (ec) {
            throw TransferError(TransferErrorKind::LocalIo,
                                "cannot truncate " + path + ": " + ec.message());
        }
        return 0;
    }
    return (have / m_opts.chunk_size) * m_opts.chunk_size;
}

void DownloadTask::execute() {
    bool prepared;
    {
        std::lock_guard<std::mutex> lock(m_info_mutex);
        prepared = m_prepared;
        m_sha256.clear();
    }
    if (!prepared) {
        prepare();
    }

    const uint64_t total = m_info.size;
    const std::string path = local_path();

    if (total == 0) {
        std::ofstream empty(path, std::ios::binary | std::ios::trunc);
        if (!empty) {
            throw TransferError(TransferErrorKind::LocalIo, "cannot create " + path);
        }
        empty.close();
        set_transferred(0);
        finish_file(0);
        return;
    }

    const uint64_t start = resume_offset(total);
    const uint64_t chunks = chunk_count(total, m_opts.chunk_size);
    set_transferred(start);

    if (!fs::exists(path)) {
        std::ofstream create(path, std::ios::binary);
        if (!create) {
            throw TransferError(TransferErrorKind::LocalIo, "cannot create " + path);
        }
    }

    std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!out) {
        throw TransferError(TransferErrorKind::LocalIo, "cannot open " + path);
    }

    if (start > 0) {
        PLOG("download", "resuming at byte " << start);
    }

    for (uint64_t i = start / m_opts.chunk_size; i < chunks; ++i) {
        if (pause_requested()) {
            mark_paused();
            return;
        }

        ChunkRange r = chunk_range(i, total, m_opts.chunk_size);
        std::string data = with_retry((int64_t)i, ("chunk " + std::to_string(i)).c_str(), [&]() {
            return m_client->download_range(m_remote_path, r.offset, r.last_byte());
        });

        out.seekp((std::streamoff)r.offset);
        out.write(data.data(), (std::streamsize)data.size());
        out.flush();
        if (!out) {
            throw TransferError(TransferErrorKind::LocalIo,
                                "write failed at offset " + std::to_string(r.offset) +
                                " in " + path, 0, (int64_t)i);
        }
        add_transferred(r.length);
    }
    out.close();

    finish_file(total);
}

void DownloadTask::finish_file(uint64_t total_size) {
    const std::string path = local_path();
    std::error_code ec;
    uint64_t have = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(TransferErrorKind::LocalIo,
                            "cannot stat " + path + ": " + ec.message());
    }
    if (have != total_size) {
        throw TransferError(TransferErrorKind::IntegrityMismatch,
                            path + " has " + std::to_string(have) +
                            " bytes, expected " + std::to_string(total_size));
    }

    std::string digest = sha256_file_hex(path);
    {
        std::lock_guard<std::mutex> lock(m_info_mutex);
        m_sha256 = digest;
    }
    PLOG("download", "done " << path << " sha256=" << digest);
}

void DownloadTask::fill_progress(TransferProgress& p) const {
    std::lock_guard<std::mutex> lock(m_info_mutex);
    p.id = m_remote_path;
    p.name = m_info.name;
    p.total_size = m_info.size;
    p.total_chunks = m_prepared ? chunk_count(m_info.size, m_opts.chunk_size) : 0;
    p.sha256 = m_sha256;
    p.local_path = m_local_path;
}
