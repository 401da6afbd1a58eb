#pragma once
#include "auth_info.h"
#include "http_client.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

struct RemoteFileInfo {
    std::string path;
    std::string name;      // last path segment
    uint64_t size = 0;
};

// Typed calls against the storage service. Every request carries the
// Authorization header built from the current AuthInfo. Non-2xx replies
// throw TransferError(HttpStatus) with the status code attached.
class StorageClient {
public:
    // Extra bytes a ranged GET may return before the read is aborted
    static constexpr uint64_t kRangeSlack = 64 * 1024;

    StorageClient(std::unique_ptr<HttpTransport> transport, AuthInfo auth);

    void set_auth(const AuthInfo& auth);
    AuthInfo auth() const;

    // HEAD /download/<path>; 404 -> FileNotFound
    RemoteFileInfo metadata(const std::string& remote_path);

    // GET /download/<path> with "Range: bytes=first-last"
    std::string download_range(const std::string& remote_path,
                               uint64_t first, uint64_t last);

    // POST /upload/init -> upload_id
    std::string init_upload(const std::string& filename, uint64_t total_size);

    // POST /upload/chunk?upload_id=&index= as multipart field "file"
    void upload_chunk(const std::string& upload_id, uint64_t index,
                      const std::string& data);

    // GET /upload/status/<id> -> indices the server already holds
    std::set<uint64_t> upload_status(const std::string& upload_id);

    void finish_upload(const std::string& upload_id,
                       const std::string& filename,
                       uint64_t total_chunks,
                       const std::optional<std::string>& target_path);

private:
    HttpResponse send(HttpRequest req, const char* what);

    std::unique_ptr<HttpTransport> m_transport;

    mutable std::mutex m_auth_mutex;
    AuthInfo m_auth;
};

// Body for a single-part multipart/form-data upload
struct MultipartBody {
    std::string content_type;
    std::string body;
};

MultipartBody make_multipart(const std::string& field,
                             const std::string& filename,
                             const std::string& data,
                             const std::string& boundary);

std::string chunk_file_name(uint64_t index);
