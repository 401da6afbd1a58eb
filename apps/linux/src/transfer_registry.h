#pragma once
#include "download_task.h"
#include "upload_task.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Runs each transfer on its own worker thread and hands out progress
// snapshots by id. Downloads are keyed "dl-<n>", uploads by the server's
// upload id.
class TransferRegistry {
public:
    TransferRegistry() = default;
    ~TransferRegistry();

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // Metadata / init run on the caller's thread so lookup failures are
    // reported right away; the chunk loop runs in the background.
    std::string start_download(std::shared_ptr<DownloadTask> task);
    std::string start_upload(std::shared_ptr<UploadTask> task);

    std::optional<TransferProgress> progress(const std::string& id);

    // false when the id is unknown
    bool pause(const std::string& id);

    // Restarts a paused or failed task; false when unknown or still running
    bool resume(const std::string& id);

    // Blocks until the task's current run has ended
    void wait(const std::string& id);

    // Pauses everything and joins the workers
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<TransferTask> task;
        std::thread worker;
    };

    void launch_locked(const std::string& id, Entry& e);

    std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    uint64_t m_next_download = 1;
};
