#pragma once
#include "transfer_task.h"
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

// Chunked multipart upload of one local file.
//
// The server is the source of truth for which chunks it holds: every run()
// asks /upload/status first and only sends the missing indices, then
// finishes the session.
class UploadTask : public TransferTask {
public:
    UploadTask(std::shared_ptr<StorageClient> client,
               std::string local_path,
               std::optional<std::string> target_path,
               TransferOptions opts = TransferOptions());

    // Stats the file and opens the server session. Returns the upload id.
    std::string init();

    std::string upload_id() const;
    const std::string& local_path() const { return m_local_path; }

protected:
    void execute() override;
    void fill_progress(TransferProgress& p) const override;

private:
    std::string read_chunk(std::ifstream& in, const ChunkRange& r) const;

    std::string m_local_path;
    std::optional<std::string> m_target_path;

    mutable std::mutex m_info_mutex;
    std::string m_upload_id;
    std::string m_filename;
    uint64_t m_size = 0;
};
