#include "app_context.h"
#include "ble_adapter.h"
#include "ble_transport.h"
#include "bluez_bus.h"
#include "debug_utils.h"
#include "radio_capability.h"
#include <nlohmann/json.hpp>
#include <filesystem>

std::string progress_json(const TransferProgress& p) {
    nlohmann::json j;
    j["id"] = p.id;
    j["name"] = p.name;
    j["total_size"] = p.total_size;
    j["transferred"] = p.transferred;
    j["total_chunks"] = p.total_chunks;
    j["percent"] = p.percent();
    j["state"] = to_string(p.state);
    if (!p.error.empty()) {
        j["error"] = p.error;
    }
    if (!p.sha256.empty()) {
        j["sha256"] = p.sha256;
    }
    if (!p.local_path.empty()) {
        j["local_path"] = p.local_path;
    }
    return j.dump();
}

AppContext::AppContext(const std::string& ini_path)
    : m_ini(new IniFile(ini_path)) {
    if (!m_ini->load()) {
        PLOG("app", "could not read " << ini_path << ", using defaults");
    }
    m_config = load_app_config(*m_ini);

    HttpEndpoint endpoint = HttpEndpoint::parse(m_config.endpoint_url());
    m_http = [endpoint]() {
        return std::unique_ptr<HttpTransport>(new BeastHttpClient(endpoint));
    };

    auto bus = std::make_shared<BluezBus>(m_config.adapter);

    DeviceManagerOptions opts;
    opts.name_prefix = m_config.name_prefix;
    opts.scan_ms = m_config.scan_ms;

    m_manager.reset(new PenDeviceManager(
        std::make_shared<BluezAdapter>(bus),
        std::unique_ptr<LinkSession>(new BleTransport(bus)),
        std::unique_ptr<RadioCapability>(new BluezAdapterPower(bus)),
        std::unique_ptr<RadioCapability>(new BluezStackProbe(bus)),
        opts));

    m_transfer_opts.retry_backoff = std::chrono::milliseconds(m_config.retry_backoff_ms);

    PLOG("app", "endpoint " << m_config.endpoint_url() << ", adapter " << m_config.adapter
         << ", downloads in " << m_config.download_dir);
}

AppContext::AppContext(AppConfig config,
                       std::unique_ptr<PenDeviceManager> manager,
                       HttpTransportFactory http,
                       TransferOptions transfer_opts)
    : m_config(std::move(config)),
      m_manager(std::move(manager)),
      m_http(std::move(http)),
      m_transfer_opts(std::move(transfer_opts)) {}

AppContext::~AppContext() {
    // Workers hold StorageClients whose refresher points back at us
    m_transfers.shutdown();
    m_manager->cleanup();
}

template <typename Fn>
CommandResult AppContext::guarded(const char* what, Fn fn) {
    try {
        return fn();
    } catch (const PenError& e) {
        PLOG("app", what << ": " << to_string(e.kind()) << ": " << e.what());
        return CommandResult::failure(std::string(to_string(e.kind())) + ": " + e.what());
    } catch (const TransferError& e) {
        PLOG("app", what << ": " << to_string(e.kind()) << ": " << e.what());
        return CommandResult::failure(std::string(to_string(e.kind())) + ": " + e.what());
    } catch (const std::exception& e) {
        PLOG("app", what << ": " << e.what());
        return CommandResult::failure(e.what());
    }
}

void AppContext::remember_peer() {
    if (!m_ini) {
        return;
    }
    auto peer = m_manager->current_device();
    if (!peer) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_ini_mutex);
    if (m_ini->get_or("pen", "address", "") == peer->address &&
        m_ini->get_or("pen", "name", "") == peer->name) {
        return;
    }
    m_ini->set("pen", "address", peer->address);
    m_ini->set("pen", "name", peer->name);
    if (!m_ini->save()) {
        PLOG("app", "failed to save " << m_ini->path());
    }
}

AuthInfo AppContext::fetch_auth() {
    AuthInfo auth;
    auth.device_id = m_manager->get_device_id();
    auth.totp = m_manager->get_totp();
    remember_peer();
    return auth;
}

std::shared_ptr<StorageClient> AppContext::make_client() {
    return std::make_shared<StorageClient>(m_http(), fetch_auth());
}

CommandResult AppContext::get_code() {
    return guarded("get-code", [&]() {
        std::string code = m_manager->get_totp();
        remember_peer();
        return CommandResult::success(code);
    });
}

CommandResult AppContext::get_device_id() {
    return guarded("get-device-id", [&]() {
        std::string id = m_manager->get_device_id();
        remember_peer();
        return CommandResult::success(id);
    });
}

CommandResult AppContext::get_connection_status() {
    return guarded("get-connection-status", [&]() {
        std::string status = m_manager->connection_status();
        if (m_ini && m_manager->phase() != ConnectionPhase::Connected) {
            std::lock_guard<std::mutex> lock(m_ini_mutex);
            auto last = m_ini->get("pen", "address");
            if (last) {
                status += " (last: " + m_ini->get_or("pen", "name", "?") + " " + *last + ")";
            }
        }
        return CommandResult::success(status);
    });
}

CommandResult AppContext::is_connected() {
    return guarded("is-connected", [&]() {
        return CommandResult::success(m_manager->is_connected() ? "true" : "false");
    });
}

CommandResult AppContext::disconnect() {
    return guarded("disconnect", [&]() {
        m_manager->disconnect();
        return CommandResult::success("disconnected");
    });
}

CommandResult AppContext::cleanup() {
    return guarded("cleanup", [&]() {
        m_transfers.shutdown();
        m_manager->cleanup();
        return CommandResult::success("cleaned up");
    });
}

CommandResult AppContext::list_devices() {
    return guarded("list", [&]() {
        std::string out;
        for (const auto& d : m_manager->scan_peers()) {
            if (!out.empty()) out += "\n";
            out += d.address + "  " + d.name;
        }
        return CommandResult::success(out);
    });
}

CommandResult AppContext::start_download(const std::string& remote_path) {
    return guarded("start-download", [&]() {
        if (remote_path.empty()) {
            return CommandResult::failure("remote path is empty");
        }
        TransferOptions opts = m_transfer_opts;
        opts.refresh_auth = [this]() { return fetch_auth(); };
        auto task = std::make_shared<DownloadTask>(make_client(), remote_path,
                                                   m_config.download_dir, opts);
        return CommandResult::success(m_transfers.start_download(task));
    });
}

CommandResult AppContext::progress_of(const std::string& id) {
    auto p = m_transfers.progress(id);
    if (!p) {
        return CommandResult::failure("unknown transfer '" + id + "'");
    }
    return CommandResult::success(progress_json(*p));
}

CommandResult AppContext::poll_download_progress(const std::string& id) {
    return guarded("poll-download-progress", [&]() { return progress_of(id); });
}

CommandResult AppContext::pause_download(const std::string& id) {
    return guarded("pause-download", [&]() {
        if (!m_transfers.pause(id)) {
            return CommandResult::failure("unknown transfer '" + id + "'");
        }
        return CommandResult::success("pausing " + id);
    });
}

CommandResult AppContext::start_upload(const std::string& local_path,
                                       const std::optional<std::string>& target_path) {
    return guarded("start-upload", [&]() {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec)) {
            return CommandResult::failure("FileNotFound: local file not found: " + local_path);
        }
        TransferOptions opts = m_transfer_opts;
        opts.refresh_auth = [this]() { return fetch_auth(); };
        auto task = std::make_shared<UploadTask>(make_client(), local_path,
                                                 target_path, opts);
        return CommandResult::success(m_transfers.start_upload(task));
    });
}

CommandResult AppContext::poll_upload_progress(const std::string& id) {
    return guarded("poll-upload-progress", [&]() { return progress_of(id); });
}

CommandResult AppContext::pause_upload(const std::string& id) {
    return guarded("pause-upload", [&]() {
        if (!m_transfers.pause(id)) {
            return CommandResult::failure("unknown transfer '" + id + "'");
        }
        return CommandResult::success("pausing " + id);
    });
}

CommandResult AppContext::resume_upload(const std::string& id) {
    return guarded("resume-upload", [&]() {
        if (!m_transfers.resume(id)) {
            return CommandResult::failure("cannot resume '" + id + "' (unknown or still running)");
        }
        return CommandResult::success("resuming " + id);
    });
}
