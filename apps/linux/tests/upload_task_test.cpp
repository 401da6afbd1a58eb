#include "auth_info.h"
#include "debug_utils.h"
#include "test_fakes.h"
#include "upload_task.h"

#include <filesystem>
#include <fstream>
#include <iostream>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;

static const std::string kContent = "The quick brown fox jumps";   // 25 bytes

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "cpenlink_ul_tests" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

static int chunk_posts(FakeStorageServer& server, uint64_t index) {
    std::lock_guard<std::mutex> lock(server.mu);
    int n = 0;
    for (const auto& r : server.requests) {
        if (r.target.rfind("/upload/chunk", 0) == 0 &&
            parse_query(r.target)["index"] == std::to_string(index)) {
            ++n;
        }
    }
    return n;
}

struct UlRig {
    std::shared_ptr<FakeStorageServer> server = std::make_shared<FakeStorageServer>();
    FakeSleeper sleeper;
    fs::path dir;
    fs::path file;

    UlRig(const std::string& name, const std::string& content = kContent)
        : dir(fresh_dir(name)), file(dir / "payload.bin") {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::unique_ptr<UploadTask> task(std::optional<std::string> target = std::nullopt) {
        AuthInfo a;
        a.device_id = "PEN-0001";
        a.totp = "123456";
        auto client = std::make_shared<StorageClient>(
            std::unique_ptr<HttpTransport>(new FakeHttpTransport(server)), a);
        TransferOptions o;
        o.chunk_size = 10;
        o.sleep = sleeper.fn();
        return std::unique_ptr<UploadTask>(
            new UploadTask(client, file.string(), std::move(target), o));
    }
};

static bool test_full_upload() {
    UlRig rig("full");
    auto task = rig.task();
    TEST_ASSERT(task->run() == TransferState::Completed, "upload completes");
    TEST_ASSERT(task->upload_id() == "up-1", "upload id from init");
    TEST_ASSERT(rig.server->assembled("up-1") == kContent, "server holds the file bytes");

    TEST_ASSERT(rig.server->finished.size() == 1, "finish called once");
    auto& fin = rig.server->finished[0];
    TEST_ASSERT(fin["upload_id"] == "up-1", "finish upload_id");
    TEST_ASSERT(fin["filename"] == "payload.bin", "finish filename");
    TEST_ASSERT(fin["total_chunks"] == "3", "finish total_chunks");
    TEST_ASSERT(!fin.count("target_path"), "target_path omitted");

    TransferProgress p = task->progress();
    TEST_ASSERT(p.transferred == 25 && p.total_chunks == 3, "progress counters");
    return true;
}

static bool test_resume_from_server_state() {
    UlRig rig("resume");
    rig.server->fail_chunk_index[2] = 3;

    auto task = rig.task();
    TEST_ASSERT(task->run() == TransferState::Error, "three failures on chunk 2 abort");
    TEST_ASSERT(task->failed_chunk() == 2, "error tagged with chunk 2");
    TEST_ASSERT(chunk_posts(*rig.server, 2) == 3, "no fourth attempt");
    TEST_ASSERT(rig.server->finished.empty(), "not finished");

    TEST_ASSERT(task->run() == TransferState::Completed, "second run completes");
    TEST_ASSERT(chunk_posts(*rig.server, 0) == 1, "accepted chunk 0 not re-sent");
    TEST_ASSERT(chunk_posts(*rig.server, 1) == 1, "accepted chunk 1 not re-sent");
    TEST_ASSERT(chunk_posts(*rig.server, 2) == 4, "only the missing chunk is sent");
    TEST_ASSERT(rig.server->assembled("up-1") == kContent, "assembled bytes");
    TEST_ASSERT(rig.server->count(HttpMethod::Post, "/upload/init") == 1, "same session reused");
    return true;
}

static bool test_retry_then_success() {
    UlRig rig("retry");
    rig.server->fail_chunk_index[1] = 2;
    auto task = rig.task();
    TEST_ASSERT(task->run() == TransferState::Completed, "two failures then success completes");
    TEST_ASSERT(chunk_posts(*rig.server, 1) == 3, "three attempts on chunk 1");
    TEST_ASSERT(rig.sleeper.calls.size() == 2, "backoff before each retry");
    return true;
}

static bool test_status_failure_means_none() {
    UlRig rig("status");
    rig.server->status_broken = true;
    auto task = rig.task();
    TEST_ASSERT(task->run() == TransferState::Completed, "broken status does not block the upload");
    TEST_ASSERT(chunk_posts(*rig.server, 0) == 1 && chunk_posts(*rig.server, 2) == 1,
                "every chunk sent once");
    return true;
}

static bool test_empty_file_and_target() {
    UlRig rig("empty", "");
    auto task = rig.task(std::string("/backup/docs"));
    TEST_ASSERT(task->run() == TransferState::Completed, "empty upload completes");
    TEST_ASSERT(chunk_posts(*rig.server, 0) == 1, "one empty chunk");
    TEST_ASSERT(rig.server->uploads["up-1"][0].empty(), "chunk has no payload");
    TEST_ASSERT(rig.server->finished[0]["total_chunks"] == "1", "total_chunks is 1");
    TEST_ASSERT(rig.server->finished[0]["target_path"] == "/backup/docs", "target_path forwarded");
    return true;
}

static bool test_missing_local_file() {
    UlRig rig("missing");
    fs::remove(rig.file);
    auto task = rig.task();
    try {
        task->init();
        TEST_ASSERT(false, "expected FileNotFound");
    } catch (const TransferError& e) {
        TEST_ASSERT(e.kind() == TransferErrorKind::FileNotFound, "kind is FileNotFound");
    }
    TEST_ASSERT(rig.server->requests.empty(), "no request for a missing file");
    return true;
}

static bool test_pause_between_chunks() {
    UlRig rig("pause");
    auto task = rig.task();
    UploadTask* raw = task.get();
    rig.server->after_request = [raw](const HttpRequest& req) {
        if (req.target.find("index=0") != std::string::npos) {
            raw->pause();
        }
    };

    TEST_ASSERT(task->run() == TransferState::Paused, "pause observed after chunk 0");
    TEST_ASSERT(task->progress().transferred == 10, "one chunk counted");
    TEST_ASSERT(chunk_posts(*rig.server, 1) == 0, "chunk 1 not sent while paused");

    rig.server->after_request = nullptr;
    TEST_ASSERT(task->run() == TransferState::Completed, "resumed upload completes");
    TEST_ASSERT(chunk_posts(*rig.server, 0) == 1, "chunk 0 sent once overall");
    TEST_ASSERT(rig.server->assembled("up-1") == kContent, "assembled bytes");
    return true;
}

int main() {
    set_log_enabled(false);
    std::cout << "--- UploadTask tests ---" << std::endl;

    if (test_full_upload())               std::cout << "PASS: full upload" << std::endl;
    if (test_resume_from_server_state())  std::cout << "PASS: resume from server state" << std::endl;
    if (test_retry_then_success())        std::cout << "PASS: retry then success" << std::endl;
    if (test_status_failure_means_none()) std::cout << "PASS: status failure means none" << std::endl;
    if (test_empty_file_and_target())     std::cout << "PASS: empty file and target" << std::endl;
    if (test_missing_local_file())        std::cout << "PASS: missing local file" << std::endl;
    if (test_pause_between_chunks())      std::cout << "PASS: pause between chunks" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
