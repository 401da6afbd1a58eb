#pragma once
#include "ble_link.h"
#include "clock_utils.h"
#include "http_client.h"
#include "pen_error.h"
#include "radio_capability.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// Time

struct FakeClock {
    std::chrono::steady_clock::time_point now{std::chrono::hours(1)};

    void advance(std::chrono::milliseconds d) { now += d; }

    SteadyClockFn fn() {
        return [this]() { return now; };
    }
};

struct FakeSleeper {
    std::vector<std::chrono::milliseconds> calls;

    SleepFn fn() {
        return [this](std::chrono::milliseconds d) { calls.push_back(d); };
    }
};

// ---------------------------------------------------------------------------
// Radio / link

struct FakeRadio : public RadioCapability {
    RadioState result = RadioState::Ok;
    int calls = 0;
    const char* label = "fake-radio";

    explicit FakeRadio(RadioState r = RadioState::Ok) : result(r) {}
    RadioState enable() override { ++calls; return result; }
    const char* name() const override { return label; }
};

struct FakeLinkAdapter : public LinkAdapter {
    std::vector<BleDeviceInfo> peers;
    int scans = 0;

    std::vector<BleDeviceInfo> scan(int) override {
        ++scans;
        return peers;
    }

    BleDeviceInfo resolve(const std::string& address, int duration_ms) override {
        for (const auto& p : scan(duration_ms)) {
            if (p.address == address) return p;
        }
        throw PenError(PenErrorKind::NoMatchingDevice, "no " + address);
    }
};

// Scripted pen: replies per command, injectable link drops.
struct FakeLinkSession : public LinkSession {
    std::map<std::string, std::string> replies;   // command prefix -> reply
    std::vector<std::string> sent;
    std::vector<std::string> connects;            // addresses
    int disconnects = 0;
    int listens = 0;

    bool connected = false;
    bool alive = false;
    bool listening = false;
    std::vector<bool> listening_at_send;

    // Next N connects fail without leaving a link
    int fail_connects = 0;

    // Callers inside connect() right now, and the most ever seen at once
    std::atomic<int> in_connect{0};
    std::atomic<int> max_in_connect{0};
    std::chrono::milliseconds connect_delay{0};

    // Next N receives for a command drop the link
    std::map<std::string, int> drop_on_receive;

    std::string pending;

    void connect(const BleDeviceInfo& peer) override {
        int now = ++in_connect;
        int seen = max_in_connect.load();
        while (now > seen && !max_in_connect.compare_exchange_weak(seen, now)) {}
        if (connect_delay.count() > 0) {
            std::this_thread::sleep_for(connect_delay);
        }

        if (connected) {
            // Mirrors the real session: never two links
            disconnect();
        }
        if (fail_connects > 0) {
            --fail_connects;
            --in_connect;
            throw PenError(PenErrorKind::ConnectFailed, "connect " + peer.address + " timed out");
        }
        connects.push_back(peer.address);
        connected = true;
        alive = true;
        --in_connect;
    }

    void listen(const std::string&, const std::string&) override {
        if (!is_alive()) {
            throw PenError(PenErrorKind::ConnectionDropped, "listen: not connected");
        }
        ++listens;
        listening = true;
    }

    bool is_alive() override { return connected && alive; }

    void send(const std::string&, const std::string&,
              const std::vector<uint8_t>& data) override {
        if (!is_alive()) {
            throw PenError(PenErrorKind::ConnectionDropped, "send: not connected");
        }
        pending.assign(data.begin(), data.end());
        sent.push_back(pending);
        listening_at_send.push_back(listening);
    }

    std::vector<uint8_t> receive(const std::string&, const std::string&,
                                 int) override {
        if (!is_alive()) {
            throw PenError(PenErrorKind::ConnectionDropped, "receive: not connected");
        }
        for (auto& kv : drop_on_receive) {
            if (kv.second > 0 && pending.rfind(kv.first, 0) == 0) {
                --kv.second;
                alive = false;
                throw PenError(PenErrorKind::ConnectionDropped, "link lost");
            }
        }
        for (const auto& kv : replies) {
            if (pending.rfind(kv.first, 0) == 0) {
                return std::vector<uint8_t>(kv.second.begin(), kv.second.end());
            }
        }
        throw PenError(PenErrorKind::ProtocolTimeout, "no reply to " + pending);
    }

    void disconnect() override {
        ++disconnects;
        connected = false;
        alive = false;
        listening = false;
    }

    int count_sent(const std::string& prefix) const {
        int n = 0;
        for (const auto& s : sent) {
            if (s.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }
};

inline BleDeviceInfo make_peer(const std::string& address, const std::string& name) {
    BleDeviceInfo p;
    p.address = address;
    p.name = name;
    return p;
}

// ---------------------------------------------------------------------------
// Storage service

inline std::string test_url_decode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            out.push_back((char)std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

inline std::map<std::string, std::string> parse_query(const std::string& target) {
    std::map<std::string, std::string> q;
    auto qpos = target.find('?');
    if (qpos == std::string::npos) return q;
    std::string rest = target.substr(qpos + 1);
    size_t start = 0;
    while (start <= rest.size()) {
        size_t amp = rest.find('&', start);
        std::string kv = rest.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        auto eq = kv.find('=');
        if (eq != std::string::npos) {
            q[test_url_decode(kv.substr(0, eq))] = test_url_decode(kv.substr(eq + 1));
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return q;
}

// In-memory storage backend with per-request failure injection.
struct FakeStorageServer {
    std::mutex mu;

    std::map<std::string, std::string> files;                       // path -> bytes
    std::map<std::string, std::map<uint64_t, std::string>> uploads; // id -> index -> bytes
    std::vector<std::map<std::string, std::string>> finished;       // finish query params
    std::vector<HttpRequest> requests;

    std::map<uint64_t, int> fail_range_from;   // range start -> remaining 500s
    std::map<uint64_t, int> fail_chunk_index;  // upload index -> remaining 500s
    int reject_auth = 0;                       // next N requests get 401
    bool status_broken = false;
    int next_upload = 1;

    // Runs after each request, outside the lock
    std::function<void(const HttpRequest&)> after_request;

    HttpResponse handle(const HttpRequest& req) {
        HttpResponse res = dispatch(req);
        if (after_request) after_request(req);
        return res;
    }

    HttpResponse dispatch(const HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mu);
        requests.push_back(req);

        HttpResponse res;
        if (reject_auth > 0) {
            --reject_auth;
            res.status = 401;
            return res;
        }

        std::string path = req.target.substr(0, req.target.find('?'));

        if (path.rfind("/download/", 0) == 0) {
            std::string name = test_url_decode(path.substr(10));
            auto it = files.find(name);
            if (it == files.end()) {
                res.status = 404;
                return res;
            }
            if (req.method == HttpMethod::Head) {
                res.status = 200;
                res.headers["content-length"] = std::to_string(it->second.size());
                return res;
            }
            auto range = req.headers.find("Range");
            if (range == req.headers.end()) {
                res.status = 200;
                res.body = it->second;
                return res;
            }
            // bytes=a-b
            std::string range_value = range->second.substr(6);
            uint64_t a = std::strtoull(range_value.c_str(), nullptr, 10);
            uint64_t b = std::strtoull(range_value.substr(range_value.find('-') + 1).c_str(), nullptr, 10);
            auto f = fail_range_from.find(a);
            if (f != fail_range_from.end() && f->second > 0) {
                --f->second;
                res.status = 500;
                return res;
            }
            res.status = 206;
            res.body = it->second.substr(a, b - a + 1);
            return res;
        }

        if (path == "/upload/init") {
            std::string id = "up-" + std::to_string(next_upload++);
            uploads[id];
            res.status = 200;
            res.body = nlohmann::json{{"upload_id", id}}.dump();
            return res;
        }

        if (path == "/upload/chunk") {
            auto q = parse_query(req.target);
            uint64_t index = std::strtoull(q["index"].c_str(), nullptr, 10);
            auto f = fail_chunk_index.find(index);
            if (f != fail_chunk_index.end() && f->second > 0) {
                --f->second;
                res.status = 500;
                return res;
            }
            auto up = uploads.find(q["upload_id"]);
            if (up == uploads.end()) {
                res.status = 404;
                return res;
            }
            // Payload sits between the part headers and the closing boundary
            auto start = req.body.find("\r\n\r\n");
            auto end = req.body.rfind("\r\n--");
            up->second[index] = req.body.substr(start + 4, end - start - 4);
            res.status = 200;
            res.body = "{}";
            return res;
        }

        if (path.rfind("/upload/status/", 0) == 0) {
            if (status_broken) {
                res.status = 500;
                return res;
            }
            auto up = uploads.find(path.substr(15));
            if (up == uploads.end()) {
                res.status = 404;
                return res;
            }
            nlohmann::json j;
            j["uploaded_chunks"] = nlohmann::json::array();
            for (const auto& kv : up->second) {
                j["uploaded_chunks"].push_back(kv.first);
            }
            res.status = 200;
            res.body = j.dump();
            return res;
        }

        if (path == "/upload/finish") {
            finished.push_back(parse_query(req.target));
            res.status = 200;
            res.body = "{}";
            return res;
        }

        res.status = 404;
        return res;
    }

    int count(HttpMethod m, const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mu);
        int n = 0;
        for (const auto& r : requests) {
            if (r.method == m && r.target.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }

    std::string assembled(const std::string& upload_id) {
        std::lock_guard<std::mutex> lock(mu);
        std::string out;
        for (const auto& kv : uploads[upload_id]) out += kv.second;
        return out;
    }
};

struct FakeHttpTransport : public HttpTransport {
    std::shared_ptr<FakeStorageServer> server;

    explicit FakeHttpTransport(std::shared_ptr<FakeStorageServer> s) : server(std::move(s)) {}

    HttpResponse perform(const HttpRequest& req) override {
        return server->handle(req);
    }
};
