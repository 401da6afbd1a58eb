#include "transfer_registry.h"
#include "debug_utils.h"

TransferRegistry::~TransferRegistry() {
    shutdown();
}

void TransferRegistry::launch_locked(const std::string& id, Entry& e) {
    if (e.worker.joinable()) {
        e.worker.join();
    }
    std::shared_ptr<TransferTask> task = e.task;
    e.worker = std::thread([task, id]() {
        TransferState st = task->run();
        PLOG("registry", id << " ended " << to_string(st));
    });
}

std::string TransferRegistry::start_download(std::shared_ptr<DownloadTask> task) {
    task->prepare();

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string id = "dl-" + std::to_string(m_next_download++);
    Entry& e = m_entries[id];
    e.task = task;
    launch_locked(id, e);
    return id;
}

std::string TransferRegistry::start_upload(std::shared_ptr<UploadTask> task) {
    std::string id = task->upload_id();
    if (id.empty()) {
        id = task->init();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    Entry& e = m_entries[id];
    if (e.task && e.task != task) {
        throw TransferError(TransferErrorKind::BadResponse,
                            "server reused upload id " + id);
    }
    e.task = task;
    launch_locked(id, e);
    return id;
}

std::optional<TransferProgress> TransferRegistry::progress(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    TransferProgress p = it->second.task->progress();
    p.id = id;
    return p;
}

bool TransferRegistry::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    it->second.task->pause();
    return true;
}

bool TransferRegistry::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    if (!it->second.task->requeue()) {
        return false;
    }
    PLOG("registry", "resuming " << id);
    launch_locked(id, it->second);
    return true;
}

void TransferRegistry::wait(const std::string& id) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end() || !it->second.worker.joinable()) {
            return;
        }
        worker = std::move(it->second.worker);
    }
    worker.join();
}

void TransferRegistry::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& kv : m_entries) {
            kv.second.task->pause();
            if (kv.second.worker.joinable()) {
                workers.push_back(std::move(kv.second.worker));
            }
        }
    }
    for (auto& w : workers) {
        w.join();
    }
}
