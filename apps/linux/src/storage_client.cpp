#include "storage_client.h"
#include "debug_utils.h"
#include "transfer_error.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <random>

static std::string download_target(const std::string& remote_path) {
    std::string p = remote_path;
    while (!p.empty() && p.front() == '/') {
        p.erase(p.begin());
    }
    return "/download/" + url_encode(p, true);
}

static std::string random_boundary() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::string b = "----cpenlink";
    for (int i = 0; i < 16; ++i) {
        b.push_back(hex[rd() & 0x0F]);
    }
    return b;
}

std::string chunk_file_name(uint64_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "chunk_%04llu", (unsigned long long)index);
    return buf;
}

MultipartBody make_multipart(const std::string& field,
                             const std::string& filename,
                             const std::string& data,
                             const std::string& boundary) {
    MultipartBody mp;
    mp.content_type = "multipart/form-data; boundary=" + boundary;
    mp.body.reserve(data.size() + 256);
    mp.body += "--" + boundary + "\r\n";
    mp.body += "Content-Disposition: form-data; name=\"" + field +
               "\"; filename=\"" + filename + "\"\r\n";
    mp.body += "Content-Type: application/octet-stream\r\n\r\n";
    mp.body += data;
    mp.body += "\r\n--" + boundary + "--\r\n";
    return mp;
}

StorageClient::StorageClient(std::unique_ptr<HttpTransport> transport, AuthInfo auth)
    : m_transport(std::move(transport)), m_auth(std::move(auth)) {}

void StorageClient::set_auth(const AuthInfo& auth) {
    std::lock_guard<std::mutex> lock(m_auth_mutex);
    m_auth = auth;
}

AuthInfo StorageClient::auth() const {
    std::lock_guard<std::mutex> lock(m_auth_mutex);
    return m_auth;
}

HttpResponse StorageClient::send(HttpRequest req, const char* what) {
    req.headers["Authorization"] = auth().header_value();
    HttpResponse res = m_transport->perform(req);
    if (res.status < 200 || res.status >= 300) {
        std::string detail = res.body.size() > 200 ? res.body.substr(0, 200) : res.body;
        throw TransferError(TransferErrorKind::HttpStatus,
                            std::string(what) + " failed: HTTP " +
                            std::to_string(res.status) +
                            (detail.empty() ? "" : " - " + detail),
                            res.status);
    }
    return res;
}

RemoteFileInfo StorageClient::metadata(const std::string& remote_path) {
    HttpRequest req;
    req.method = HttpMethod::Head;
    req.target = download_target(remote_path);

    HttpResponse res;
    try {
        res = send(req, "metadata");
    } catch (const TransferError& e) {
        if (e.http_status() == 404) {
            throw TransferError(TransferErrorKind::FileNotFound,
                                "remote file not found: " + remote_path, 404);
        }
        throw;
    }

    auto len = res.header("Content-Length");
    if (!len) {
        throw TransferError(TransferErrorKind::BadResponse,
                            "no Content-Length for " + remote_path);
    }
    char* end = nullptr;
    unsigned long long size = std::strtoull(len->c_str(), &end, 10);
    if (len->empty() || (end && *end != '\0')) {
        throw TransferError(TransferErrorKind::BadResponse,
                            "bad Content-Length '" + *len + "' for " + remote_path);
    }

    RemoteFileInfo info;
    info.path = remote_path;
    info.size = size;
    std::string trimmed = remote_path;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto slash = trimmed.rfind('/');
    info.name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    if (info.name.empty()) {
        info.name = "download.bin";
    }
    return info;
}

std::string StorageClient::download_range(const std::string& remote_path,
                                          uint64_t first, uint64_t last) {
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.target = download_target(remote_path);
    req.headers["Range"] = "bytes=" + std::to_string(first) + "-" + std::to_string(last);
    const uint64_t expected = last - first + 1;
    // A server ignoring Range can only be served up to this much
    req.body_limit = expected + kRangeSlack;

    HttpResponse res = send(req, "download");

    if (res.status == 200 && res.body.size() > expected && res.body.size() > last) {
        // Server ignored Range and sent the whole object
        return res.body.substr(first, expected);
    }
    if (res.body.size() != expected) {
        throw TransferError(TransferErrorKind::BadResponse,
                            "range " + std::to_string(first) + "-" + std::to_string(last) +
                            " returned " + std::to_string(res.body.size()) + " bytes",
                            res.status);
    }
    return std::move(res.body);
}

std::string StorageClient::init_upload(const std::string& filename, uint64_t total_size) {
    HttpRequest req;
    req.method = HttpMethod::Post;
    req.target = "/upload/init";

    HttpResponse res = send(req, "upload init");
    try {
        auto j = nlohmann::json::parse(res.body);
        std::string id = j.at("upload_id").get<std::string>();
        if (id.empty()) {
            throw TransferError(TransferErrorKind::BadResponse, "upload init: empty upload_id");
        }
        PLOG("storage", "upload " << id << " for " << filename << " (" << total_size << " bytes)");
        return id;
    } catch (const nlohmann::json::exception& e) {
        throw TransferError(TransferErrorKind::BadResponse,
                            std::string("upload init: ") + e.what());
    }
}

void StorageClient::upload_chunk(const std::string& upload_id, uint64_t index,
                                 const std::string& data) {
    MultipartBody mp = make_multipart("file", chunk_file_name(index), data, random_boundary());

    HttpRequest req;
    req.method = HttpMethod::Post;
    req.target = "/upload/chunk" + build_query({{"upload_id", upload_id},
                                                {"index", std::to_string(index)}});
    req.headers["Content-Type"] = mp.content_type;
    req.body = std::move(mp.body);

    send(std::move(req), "upload chunk");
}

std::set<uint64_t> StorageClient::upload_status(const std::string& upload_id) {
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.target = "/upload/status/" + url_encode(upload_id);

    HttpResponse res = send(req, "upload status");
    std::set<uint64_t> out;
    try {
        auto j = nlohmann::json::parse(res.body);
        for (const auto& v : j.at("uploaded_chunks")) {
            out.insert(v.get<uint64_t>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw TransferError(TransferErrorKind::BadResponse,
                            std::string("upload status: ") + e.what());
    }
    return out;
}

void StorageClient::finish_upload(const std::string& upload_id,
                                  const std::string& filename,
                                  uint64_t total_chunks,
                                  const std::optional<std::string>& target_path) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"upload_id", upload_id},
        {"filename", filename},
        {"total_chunks", std::to_string(total_chunks)},
    };
    if (target_path && !target_path->empty()) {
        params.emplace_back("target_path", *target_path);
    }

    HttpRequest req;
    req.method = HttpMethod::Post;
    req.target = "/upload/finish" + build_query(params);

    send(std::move(req), "upload finish");
}
