#pragma once
#include "transfer_task.h"
#include <mutex>
#include <string>

// Range download of one remote file into the download directory.
//
// Resume point is the length of an existing local file rounded down to a
// chunk boundary, so re-running a finished or half-finished task never
// rewrites the file with different bytes.
class DownloadTask : public TransferTask {
public:
    DownloadTask(std::shared_ptr<StorageClient> client,
                 std::string remote_path,
                 std::string download_dir,
                 TransferOptions opts = TransferOptions());

    // HEAD the remote file and fix the local destination
    void prepare();

    const std::string& remote_path() const { return m_remote_path; }
    std::string local_path() const;
    std::string sha256() const;

protected:
    void execute() override;
    void fill_progress(TransferProgress& p) const override;

private:
    uint64_t resume_offset(uint64_t total_size) const;
    void finish_file(uint64_t total_size);

    std::string m_remote_path;
    std::string m_download_dir;

    mutable std::mutex m_info_mutex;
    bool m_prepared = false;
    RemoteFileInfo m_info;
    std::string m_local_path;
    std::string m_sha256;
};
